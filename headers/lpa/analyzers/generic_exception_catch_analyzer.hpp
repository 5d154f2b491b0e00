//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_GENERIC_EXCEPTION_CATCH_ANALYZER_HPP
#define LPA_GENERIC_EXCEPTION_CATCH_ANALYZER_HPP

#include "lpa/analyzers/analyzer.hpp"

#include <string_view>
#include <vector>

namespace lpa::analyzers {

    /**
     * Flags catch clauses for Exception or Throwable.
     */
    class GenericExceptionCatchAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "generic-exception-catch";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Generic Exception Catch Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects catching generic Exception class instead of specific exception types";
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
    };

    /**
     * Type names listed in a catch clause, without a leading backslash.
     */
    [[nodiscard]] std::vector<std::string_view> caught_types(const syntax::SyntaxNode& clause);

    void register_generic_exception_catch_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_GENERIC_EXCEPTION_CATCH_ANALYZER_HPP
