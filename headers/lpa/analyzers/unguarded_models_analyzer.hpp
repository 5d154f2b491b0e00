//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_UNGUARDED_MODELS_ANALYZER_HPP
#define LPA_UNGUARDED_MODELS_ANALYZER_HPP

/**
 * @file unguarded_models_analyzer.hpp
 * @brief Model::unguard() without a matching Model::reguard().
 *
 * Each reguard() later in the file settles one earlier unguard(). The
 * severity depends on where the file lives: Critical in controllers,
 * models and services, Medium in seeders, Low in tests, High elsewhere.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class UnguardedModelsAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "unguarded-models";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Unguarded Models Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects Model::unguard() usage that disables mass assignment protection";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Security;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        /// Severity of an unguard() left open in the given file.
        [[nodiscard]] static Severity severity_for_path(std::string_view relative_path);
    };

    void register_unguarded_models_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_UNGUARDED_MODELS_ANALYZER_HPP
