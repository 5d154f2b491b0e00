//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_PHP_SIDE_FILTERING_ANALYZER_HPP
#define LPA_PHP_SIDE_FILTERING_ANALYZER_HPP

/**
 * @file php_side_filtering_analyzer.hpp
 * @brief Query results filtered as a collection instead of in SQL.
 *
 * Reports chains where a fetching call (get, all) is immediately
 * followed by a collection filter (filter, reject, whereIn, whereNotIn),
 * e.g. User::all()->filter(fn ($u) => $u->active). The chain must start
 * at a model class, a variable or a relation property.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class PhpSideFilteringAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "php-side-filtering";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "PHP-Side Filtering Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects filtering data in PHP collections instead of the database";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Performance;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Critical;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    void register_php_side_filtering_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_PHP_SIDE_FILTERING_ANALYZER_HPP
