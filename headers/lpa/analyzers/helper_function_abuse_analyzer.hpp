//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_HELPER_FUNCTION_ABUSE_ANALYZER_HPP
#define LPA_HELPER_FUNCTION_ABUSE_ANALYZER_HPP

/**
 * @file helper_function_abuse_analyzer.hpp
 * @brief Classes and traits with too many global helper calls.
 *
 * Every call to a tracked helper (app(), auth(), request(), ...) counts,
 * repeated calls included. Calls inside an anonymous class count toward
 * the named class around it.
 */

#include "lpa/analyzers/analyzer.hpp"

#include <string>
#include <vector>

namespace lpa::analyzers {

    class HelperFunctionAbuseAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "helper-function-abuse";
        static constexpr std::size_t DEFAULT_THRESHOLD = 5;

        HelperFunctionAbuseAnalyzer();

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Helper Function Abuse Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects excessive use of Laravel helper functions that hide dependencies and hinder testing";
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

        [[nodiscard]] Result<void, Error> configure(const AnalyzerSettings& settings) override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;

        [[nodiscard]] std::size_t threshold() const noexcept { return threshold_; }
        [[nodiscard]] bool is_helper(std::string_view function) const;

    private:
        std::size_t threshold_ = DEFAULT_THRESHOLD;
        std::vector<std::string> helpers_;
    };

    void register_helper_function_abuse_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_HELPER_FUNCTION_ABUSE_ANALYZER_HPP
