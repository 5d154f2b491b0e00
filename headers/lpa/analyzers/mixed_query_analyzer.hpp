//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_MIXED_QUERY_ANALYZER_HPP
#define LPA_MIXED_QUERY_ANALYZER_HPP

/**
 * @file mixed_query_analyzer.hpp
 * @brief Classes reaching the same tables through Eloquent and the query builder.
 *
 * Usage is collected per class:
 * - Eloquent: chains rooted at a model class, or at a variable holding an
 *   Eloquent query, resolved to a table through the model registry
 * - Query builder: DB::table('literal') chains, and optionally Eloquent
 *   chains converted with toBase()/getQuery()
 *
 * Calls on relation methods ($user->posts()->where(...)) are not resolved
 * to a table.
 */

#include "lpa/analyzers/analyzer.hpp"

#include <string>
#include <vector>

namespace lpa::analyzers {

    class MixedQueryAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "mixed-query-builder-eloquent";
        static constexpr std::size_t DEFAULT_THRESHOLD = 2;

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Mixed Query Builder and Eloquent Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects classes that query the same tables through both Eloquent and the Query Builder";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::High;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        /**
         * Checks a class name against the whitelist.
         *
         * Patterns are globs matched against both the short and the fully
         * qualified name. Anonymous classes never match.
         */
        [[nodiscard]] bool is_whitelisted(std::string_view class_name, std::string_view qualified_name) const;

        [[nodiscard]] std::size_t threshold() const noexcept { return threshold_; }
        [[nodiscard]] bool counts_to_base_as_query_builder() const noexcept { return count_to_base_; }

    private:
        std::size_t threshold_ = DEFAULT_THRESHOLD;
        std::vector<std::string> whitelist_;
        bool count_to_base_ = false;
    };

    void register_mixed_query_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_MIXED_QUERY_ANALYZER_HPP
