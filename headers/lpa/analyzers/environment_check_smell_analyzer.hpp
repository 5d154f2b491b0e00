//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_ENVIRONMENT_CHECK_SMELL_ANALYZER_HPP
#define LPA_ENVIRONMENT_CHECK_SMELL_ANALYZER_HPP

/**
 * @file environment_check_smell_analyzer.hpp
 * @brief Behaviour switched on app()->environment() instead of config.
 *
 * Service providers and exception handlers are skipped; environment
 * checks belong there.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class EnvironmentCheckSmellAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "environment-check-smell";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Environment Check Code Smell Detector";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects environment checks that should use configuration values instead";
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

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    void register_environment_check_smell_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_ENVIRONMENT_CHECK_SMELL_ANALYZER_HPP
