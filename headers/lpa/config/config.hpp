//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_CONFIG_HPP
#define LPA_CONFIG_HPP

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/types.hpp"
#include "lpa/analyzers/analyzer.hpp"
#include "lpa/utils/logging.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lpa::config {

    inline constexpr const char* DEFAULT_CONFIG_FILE = "lpa.toml";

    enum class OutputFormat {
        Text,
        Json,
        Markdown
    };

    struct GeneralConfig {
        std::string base_path = ".";
        std::vector<std::string> paths = {"app", "config", "database", "routes"};
        std::vector<std::string> excluded_paths = {
            "vendor/*", "node_modules/*", "storage/*", "bootstrap/cache/*"
        };
        std::int64_t threads = 0;
    };

    struct ModelsConfig {
        std::vector<std::string> paths = {"app/Models"};
        std::vector<std::string> base_classes;
        std::map<std::string, std::string> table_mappings;
        bool cache = false;
        std::string cache_dir = ".lpa/cache";
    };

    struct AnalyzersConfig {
        std::vector<std::string> disabled;
        std::vector<std::string> categories;        ///< Empty = every category

        /// One entry per [analyzers.<rule-id>] table.
        std::map<std::string, analyzers::AnalyzerSettings, std::less<>> settings;
    };

    struct ReportConfig {
        std::string fail_on = "high";
        std::vector<std::string> dont_report;
        std::string baseline_file = ".lpa-baseline.json";
        std::string format = "text";
    };

    class Config {
    public:
        Config() = default;

        GeneralConfig general;
        ModelsConfig models;
        AnalyzersConfig analyzers;
        ReportConfig report;
        logging::LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @param path Filesystem path to the config file.
         * @return The validated Config, or IoError / ParseError / ConfigError.
         */
        static Result<Config, Error> load_from_file(const fs::path& path);

        /**
         * Load configuration from TOML text.
         *
         * Values of the wrong type are collected together with the
         * validation problems and reported as a single ConfigError.
         */
        static Result<Config, Error> load_from_string(const std::string& content);

        static Config default_config();

        [[nodiscard]] Result<void, Error> save_to_file(const fs::path& path) const;

        /**
         * Renders the configuration as TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Checks every value and reports all problems at once.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Settings of one analyzer; an empty bag when none are configured.
         */
        [[nodiscard]] analyzers::AnalyzerSettings settings_for(std::string_view rule_id) const;

        /**
         * Checks whether an analyzer should run given disabled ids and categories.
         */
        [[nodiscard]] bool is_enabled(const analyzers::IAnalyzer& analyzer) const;

        /**
         * The fail_on threshold; nullopt means never fail.
         */
        [[nodiscard]] Result<std::optional<Severity>, Error> fail_on_level() const;

        [[nodiscard]] Result<OutputFormat, Error> output_format() const;

        /**
         * base_path joined to a relative path; absolute paths are kept.
         */
        [[nodiscard]] fs::path resolve(const std::string& path) const;

    private:
        [[nodiscard]] std::vector<std::string> problems() const;
    };

    const char* to_string(OutputFormat format) noexcept;
    std::optional<OutputFormat> output_format_from_string(std::string_view str) noexcept;

}  // namespace lpa::config

#endif //LPA_CONFIG_HPP
