//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef LPA_CONFIG_OUTSIDE_CONFIG_ANALYZER_HPP
#define LPA_CONFIG_OUTSIDE_CONFIG_ANALYZER_HPP

/**
 * @file config_outside_config_analyzer.hpp
 * @brief URLs and secrets hardcoded outside config/.
 *
 * Plain string literals starting with http:// or https:// are Medium,
 * except links to example.com and well-known documentation sites. A
 * purely alphanumeric literal longer than 30 characters looks like an
 * API key and is High.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class ConfigOutsideConfigAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "config-outside-config";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "Hardcoded Configuration Detector";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects configuration values hardcoded in code instead of config files";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Medium;
        }

        [[nodiscard]] bool should_analyze(std::string_view relative_path) const override;

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    [[nodiscard]] bool is_hardcoded_url(std::string_view value);
    [[nodiscard]] bool looks_like_secret(std::string_view value) noexcept;

    void register_config_outside_config_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_CONFIG_OUTSIDE_CONFIG_ANALYZER_HPP
