//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_SILENT_FAILURE_ANALYZER_HPP
#define LPA_SILENT_FAILURE_ANALYZER_HPP

/**
 * @file silent_failure_analyzer.hpp
 * @brief Exceptions and errors that disappear without a trace.
 *
 * Catch clauses:
 * - empty or comment-only bodies (High), unless a comment marks the
 *   swallow as intentional
 * - Throwable, Exception or Error without a rethrow (High)
 * - bodies that neither use the exception, log or report it, fall back
 *   to a meaningful value nor rethrow (Medium)
 *
 * Catches of expected exceptions (ModelNotFoundException and friends)
 * are skipped unless a broad type shares the clause.
 *
 * The @ operator is Medium, High inside a catch clause or on a dynamic
 * call. Cleanup calls such as @unlink() are allowed.
 */

#include "lpa/analyzers/analyzer.hpp"

#include <string>
#include <vector>

namespace lpa::analyzers {

    class SilentFailureAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "silent-failure";

        SilentFailureAnalyzer();

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Silent Failure Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects empty catch blocks and error suppression that hide failures";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Medium;
        }

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] bool is_whitelisted_class(std::string_view class_name) const;
        [[nodiscard]] bool is_whitelisted_exception(std::string_view type) const;

        /**
         * Checks whether the @ operator may silence this expression.
         */
        [[nodiscard]] bool allows_suppression(const syntax::SyntaxNode& expr) const;

    private:
        std::vector<std::string> whitelist_dirs_;
        std::vector<std::string> whitelist_classes_;
        std::vector<std::string> whitelist_exceptions_;
        std::vector<std::string> suppression_functions_;
        std::vector<std::string> suppression_static_methods_;
        std::vector<std::string> suppression_instance_methods_;
    };

    void register_silent_failure_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_SILENT_FAILURE_ANALYZER_HPP
