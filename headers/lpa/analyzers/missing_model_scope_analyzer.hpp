//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_MISSING_MODEL_SCOPE_ANALYZER_HPP
#define LPA_MISSING_MODEL_SCOPE_ANALYZER_HPP

/**
 * @file missing_model_scope_analyzer.hpp
 * @brief Where-clause combinations repeated across the codebase.
 *
 * Every query chain with two or more where*() calls contributes each of
 * its contiguous sub-chains of length two or more, keyed by method names
 * and literal arguments. A key seen at least twice across all analyzed
 * files is reported once, at its first occurrence.
 */

#include "lpa/analyzers/analyzer.hpp"
#include "lpa/syntax/php_nodes.hpp"

#include <string>
#include <vector>

namespace lpa::analyzers {

    class MissingModelScopeAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "missing-model-scope";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Missing Model Scope Detector";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects repeated query patterns that should be extracted to model scopes";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Low;
        }

        [[nodiscard]] Severity failing_severity() const noexcept override {
            return Severity::Low;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        /**
         * Collapses the per-occurrence issues of every pattern seen at
         * least twice into one issue at the first occurrence, and drops
         * patterns seen once.
         */
        void finalize_issues(std::vector<Issue>& issues) const override;
    };

    /**
     * A where*() call with the literal arguments it was given.
     */
    struct WhereCall {
        std::string method;
        std::vector<std::string> arguments;
    };

    /**
     * Collects the where*() calls of a query chain, innermost first.
     * Chains with fewer than two where calls give an empty list.
     */
    [[nodiscard]] std::vector<WhereCall> where_chain(const syntax::CallChain& chain);

    void register_missing_model_scope_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_MISSING_MODEL_SCOPE_ANALYZER_HPP
