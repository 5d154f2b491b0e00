//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_N_PLUS_ONE_ANALYZER_HPP
#define LPA_N_PLUS_ONE_ANALYZER_HPP

/**
 * @file n_plus_one_analyzer.hpp
 * @brief Lazy-loaded relationships and queries inside loops.
 *
 * Two findings:
 * - lazy-loaded-relationship: inside a foreach over models, a property
 *   chain on the loop variable reaches a relation that was not eager-loaded
 *   by the query that produced the collection
 * - query-in-loop: any query executed lexically inside the body of a loop
 *
 * Only foreach loops bind a loop variable to a collection element, so
 * only they are checked for lazy relations. for/while/do loops are still
 * checked for queries.
 */

#include "lpa/analyzers/analyzer.hpp"

#include <set>
#include <string>

namespace lpa::analyzers {

    /**
     * Detects N+1 query patterns.
     */
    class NPlusOneAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "eloquent-n-plus-one";

        NPlusOneAnalyzer();

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Eloquent N+1 Query Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Identifies missing eager loading that causes N+1 query performance problems";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Performance;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        /**
         * Checks whether a property name is a column-like attribute rather
         * than a relation. Comparison is case-insensitive.
         */
        [[nodiscard]] bool is_plain_attribute(std::string_view property) const;

        [[nodiscard]] bool checks_queries_in_loops() const noexcept { return check_queries_in_loops_; }

    private:
        std::set<std::string, std::less<>> plain_attributes_;
        bool check_queries_in_loops_ = true;
    };

    void register_n_plus_one_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_N_PLUS_ONE_ANALYZER_HPP
