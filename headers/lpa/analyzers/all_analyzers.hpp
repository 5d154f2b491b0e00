//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_ALL_ANALYZERS_HPP
#define LPA_ALL_ANALYZERS_HPP

/**
 * @file all_analyzers.hpp
 * @brief Includes and registers all available analyzers.
 */

#include "lpa/analyzers/n_plus_one_analyzer.hpp"
#include "lpa/analyzers/mixed_query_analyzer.hpp"
#include "lpa/analyzers/missing_transaction_analyzer.hpp"
#include "lpa/analyzers/generic_exception_catch_analyzer.hpp"
#include "lpa/analyzers/sql_injection_analyzer.hpp"
#include "lpa/analyzers/select_asterisk_analyzer.hpp"
#include "lpa/analyzers/php_side_filtering_analyzer.hpp"
#include "lpa/analyzers/logic_in_routes_analyzer.hpp"
#include "lpa/analyzers/fat_model_analyzer.hpp"
#include "lpa/analyzers/mvc_structure_analyzer.hpp"
#include "lpa/analyzers/chunk_missing_analyzer.hpp"
#include "lpa/analyzers/query_builder_in_controller_analyzer.hpp"
#include "lpa/analyzers/raw_eloquent_avoidance_analyzer.hpp"
#include "lpa/analyzers/silent_failure_analyzer.hpp"
#include "lpa/analyzers/missing_model_scope_analyzer.hpp"
#include "lpa/analyzers/service_container_resolution_analyzer.hpp"
#include "lpa/analyzers/facade_usage_analyzer.hpp"
#include "lpa/analyzers/helper_function_abuse_analyzer.hpp"
#include "lpa/analyzers/config_outside_config_analyzer.hpp"
#include "lpa/analyzers/environment_check_smell_analyzer.hpp"
#include "lpa/analyzers/hardcoded_storage_paths_analyzer.hpp"
#include "lpa/analyzers/mass_assignment_analyzer.hpp"
#include "lpa/analyzers/unguarded_models_analyzer.hpp"
#include "lpa/analyzers/fillable_foreign_key_analyzer.hpp"

namespace lpa::analyzers {

    /**
     * Registers all available analyzers with the global registry.
     */
    inline void register_all_analyzers() {
        register_n_plus_one_analyzer();
        register_mixed_query_analyzer();
        register_missing_transaction_analyzer();
        register_generic_exception_catch_analyzer();
        register_sql_injection_analyzer();
        register_select_asterisk_analyzer();
        register_php_side_filtering_analyzer();
        register_logic_in_routes_analyzer();
        register_fat_model_analyzer();
        register_mvc_structure_analyzer();
        register_chunk_missing_analyzer();
        register_query_builder_in_controller_analyzer();
        register_raw_eloquent_avoidance_analyzer();
        register_silent_failure_analyzer();
        register_missing_model_scope_analyzer();
        register_service_container_resolution_analyzer();
        register_facade_usage_analyzer();
        register_helper_function_abuse_analyzer();
        register_config_outside_config_analyzer();
        register_environment_check_smell_analyzer();
        register_hardcoded_storage_paths_analyzer();
        register_mass_assignment_analyzer();
        register_unguarded_models_analyzer();
        register_fillable_foreign_key_analyzer();
    }

}  // namespace lpa::analyzers

#endif //LPA_ALL_ANALYZERS_HPP
