//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/config/config.hpp"
#include "lpa/engine/report.hpp"
#include "lpa/utils/file_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <array>
#include <sstream>
#include <type_traits>
#include <variant>

namespace lpa::config
{
    namespace {

        constexpr std::array<std::string_view, 7> LOG_LEVELS = {
            "trace", "debug", "info", "warn", "error", "critical", "off",
        };

        /**
         * Typed reads from one TOML table. A present value of the wrong
         * type leaves the target untouched and records a problem.
         */
        class SectionReader {
        public:
            SectionReader(const toml::table& table, std::string section, std::vector<std::string>& problems)
                : table_(table), section_(std::move(section)), problems_(problems) {}

            void read(const std::string_view key, std::string& out) const {
                const auto node = table_[key];
                if (!node) return;
                if (auto value = node.value<std::string>()) {
                    out = std::move(*value);
                } else {
                    mistyped(key, "a string");
                }
            }

            void read(const std::string_view key, bool& out) const {
                const auto node = table_[key];
                if (!node) return;
                if (auto value = node.value<bool>(); value && node.is_boolean()) {
                    out = *value;
                } else {
                    mistyped(key, "a boolean");
                }
            }

            void read(const std::string_view key, std::int64_t& out) const {
                const auto node = table_[key];
                if (!node) return;
                if (node.is_integer()) {
                    out = node.as_integer()->get();
                } else {
                    mistyped(key, "an integer");
                }
            }

            void read(const std::string_view key, std::vector<std::string>& out) const {
                const auto node = table_[key];
                if (!node) return;
                const auto* array = node.as_array();
                if (array == nullptr || !array->is_homogeneous(toml::node_type::string)) {
                    if (array != nullptr && array->empty()) {
                        out.clear();
                        return;
                    }
                    mistyped(key, "an array of strings");
                    return;
                }
                out.clear();
                for (const auto& element : *array) {
                    out.emplace_back(element.value_or(std::string{}));
                }
            }

            void read(const std::string_view key, std::map<std::string, std::string>& out) const {
                const auto node = table_[key];
                if (!node) return;
                const auto* table = node.as_table();
                if (table == nullptr) {
                    mistyped(key, "a table of strings");
                    return;
                }
                std::map<std::string, std::string> values;
                for (auto&& [name, value] : *table) {
                    auto text = value.value<std::string>();
                    if (!text || !value.is_string()) {
                        mistyped(std::string(key) + "." + std::string(name.str()), "a string");
                        return;
                    }
                    values.emplace(std::string(name.str()), std::move(*text));
                }
                out = std::move(values);
            }

        private:
            void mistyped(const std::string_view key, const std::string_view expected) const {
                problems_.push_back(section_ + "." + std::string(key) + " must be " + std::string(expected));
            }

            const toml::table& table_;
            std::string section_;
            std::vector<std::string>& problems_;
        };

        analyzers::SettingValue to_setting(const toml::node& node) {
            if (node.is_boolean()) {
                return node.as_boolean()->get();
            }
            if (node.is_integer()) {
                return node.as_integer()->get();
            }
            if (node.is_floating_point()) {
                return node.as_floating_point()->get();
            }
            if (node.is_string()) {
                return node.as_string()->get();
            }
            if (const auto* array = node.as_array()) {
                if (!array->empty() && !array->is_homogeneous(toml::node_type::string)) {
                    return std::monostate{};
                }
                std::vector<std::string> values;
                for (const auto& element : *array) {
                    values.emplace_back(element.value_or(std::string{}));
                }
                return values;
            }
            if (const auto* table = node.as_table()) {
                std::map<std::string, std::string> values;
                for (auto&& [key, value] : *table) {
                    auto text = value.value<std::string>();
                    if (!text || !value.is_string()) {
                        return std::monostate{};
                    }
                    values.emplace(std::string(key.str()), std::move(*text));
                }
                return values;
            }
            return std::monostate{};
        }

        std::string quote(const std::string_view text) {
            std::string result = "\"";
            for (const char c : text) {
                if (c == '"' || c == '\\') {
                    result += '\\';
                }
                result += c;
            }
            result += '"';
            return result;
        }

        std::string render_list(const std::vector<std::string>& values) {
            std::ostringstream ss;
            ss << "[";
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << quote(values[i]);
            }
            ss << "]";
            return ss.str();
        }

        std::string render_map(const std::map<std::string, std::string>& values) {
            std::ostringstream ss;
            ss << "{";
            bool first = true;
            for (const auto& [key, value] : values) {
                ss << (first ? " " : ", ") << quote(key) << " = " << quote(value);
                first = false;
            }
            ss << (values.empty() ? "}" : " }");
            return ss.str();
        }

        std::string render_setting(const analyzers::SettingValue& value) {
            return std::visit([]<typename T>(const T& v) -> std::string {
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "\"\"";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    std::ostringstream ss;
                    ss << v;
                    return ss.str();
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return quote(v);
                } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    return render_list(v);
                } else {
                    return render_map(v);
                }
            }, value);
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(
                Error::io_error("Configuration file not readable", path.string()));
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<Config, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;
            std::vector<std::string> problems;

            if (tbl["general"].is_table()) {
                const SectionReader general(*tbl["general"].as_table(), "general", problems);
                general.read("base_path", config.general.base_path);
                general.read("paths", config.general.paths);
                general.read("excluded_paths", config.general.excluded_paths);
                general.read("threads", config.general.threads);
            }

            if (tbl["models"].is_table()) {
                const SectionReader models(*tbl["models"].as_table(), "models", problems);
                models.read("paths", config.models.paths);
                models.read("base_classes", config.models.base_classes);
                models.read("table_mappings", config.models.table_mappings);
                models.read("cache", config.models.cache);
                models.read("cache_dir", config.models.cache_dir);
            }

            if (tbl["analyzers"].is_table()) {
                auto& analyzers_table = *tbl["analyzers"].as_table();
                const SectionReader analyzers(analyzers_table, "analyzers", problems);
                analyzers.read("disabled", config.analyzers.disabled);
                analyzers.read("categories", config.analyzers.categories);

                for (auto&& [key, node] : analyzers_table) {
                    const auto* rule_table = node.as_table();
                    if (rule_table == nullptr) {
                        continue;
                    }
                    analyzers::AnalyzerSettings settings{std::string(key.str())};
                    for (auto&& [option, value] : *rule_table) {
                        settings.set(std::string(option.str()), to_setting(value));
                    }
                    config.analyzers.settings.insert_or_assign(std::string(key.str()), std::move(settings));
                }
            }

            if (tbl["report"].is_table()) {
                const SectionReader report(*tbl["report"].as_table(), "report", problems);
                report.read("fail_on", config.report.fail_on);
                report.read("dont_report", config.report.dont_report);
                report.read("baseline_file", config.report.baseline_file);
                report.read("format", config.report.format);
            }

            if (tbl["logging"].is_table()) {
                const SectionReader log(*tbl["logging"].as_table(), "logging", problems);
                log.read("level", config.logging.level);
                log.read("file", config.logging.file);
                log.read("console", config.logging.console);
            }

            auto remaining = config.problems();
            problems.insert(problems.end(), remaining.begin(), remaining.end());
            if (!problems.empty()) {
                return Result<Config, Error>::failure(Error::config_error(
                    "Configuration validation failed:\n  " + string_utils::join(problems, "\n  ")));
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            std::ostringstream message;
            message << "Failed to parse TOML configuration: " << err.description()
                    << " (line " << err.source().begin.line << ")";
            return Result<Config, Error>::failure(Error::parse_error(message.str()));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::save_to_file(const fs::path& path) const {
        return file_utils::write_file(path, to_string());
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[general]\n";
        ss << "base_path = " << quote(general.base_path) << "\n";
        ss << "paths = " << render_list(general.paths) << "\n";
        ss << "excluded_paths = " << render_list(general.excluded_paths) << "\n";
        ss << "threads = " << general.threads << "\n\n";

        ss << "[models]\n";
        ss << "paths = " << render_list(models.paths) << "\n";
        ss << "base_classes = " << render_list(models.base_classes) << "\n";
        ss << "table_mappings = " << render_map(models.table_mappings) << "\n";
        ss << "cache = " << (models.cache ? "true" : "false") << "\n";
        ss << "cache_dir = " << quote(models.cache_dir) << "\n\n";

        ss << "[analyzers]\n";
        ss << "disabled = " << render_list(analyzers.disabled) << "\n";
        ss << "categories = " << render_list(analyzers.categories) << "\n\n";

        for (const auto& [rule_id, settings] : analyzers.settings) {
            ss << "[analyzers." << rule_id << "]\n";
            for (const auto& [key, value] : settings.values()) {
                ss << key << " = " << render_setting(value) << "\n";
            }
            ss << "\n";
        }

        ss << "[report]\n";
        ss << "fail_on = " << quote(report.fail_on) << "\n";
        ss << "dont_report = " << render_list(report.dont_report) << "\n";
        ss << "baseline_file = " << quote(report.baseline_file) << "\n";
        ss << "format = " << quote(report.format) << "\n\n";

        ss << "[logging]\n";
        ss << "level = " << quote(logging.level) << "\n";
        ss << "file = " << quote(logging.file) << "\n";
        ss << "console = " << (logging.console ? "true" : "false") << "\n";

        return ss.str();
    }

    std::vector<std::string> Config::problems() const {
        std::vector<std::string> errors;

        if (general.threads < 0) {
            errors.emplace_back("general.threads must be non-negative");
        }

        if (general.paths.empty()) {
            errors.emplace_back("general.paths must name at least one directory");
        }

        if (models.cache && models.cache_dir.empty()) {
            errors.emplace_back("models.cache_dir required when models.cache is enabled");
        }

        for (const auto& category : analyzers.categories) {
            if (!category_from_string(category)) {
                errors.push_back("analyzers.categories: unknown category \"" + category + "\"");
            }
        }

        if (fail_on_level().is_err()) {
            errors.push_back("report.fail_on must be one of never, low, medium, high, critical (got \"" +
                             report.fail_on + "\")");
        }

        if (!output_format_from_string(report.format)) {
            errors.push_back("report.format must be one of text, json, markdown (got \"" + report.format + "\")");
        }

        if (std::ranges::find(LOG_LEVELS, std::string_view(logging.level)) == LOG_LEVELS.end()) {
            errors.push_back("logging.level: unknown level \"" + logging.level + "\"");
        }

        return errors;
    }

    Result<void, Error> Config::validate() const {
        const auto errors = problems();
        if (!errors.empty()) {
            return Result<void, Error>::failure(Error::config_error(
                "Configuration validation failed:\n  " + string_utils::join(errors, "\n  ")));
        }
        return Result<void, Error>::success();
    }

    analyzers::AnalyzerSettings Config::settings_for(const std::string_view rule_id) const {
        if (const auto it = analyzers.settings.find(rule_id); it != analyzers.settings.end()) {
            return it->second;
        }
        return analyzers::AnalyzerSettings{std::string(rule_id)};
    }

    bool Config::is_enabled(const analyzers::IAnalyzer& analyzer) const {
        if (std::ranges::find(analyzers.disabled, analyzer.id()) != analyzers.disabled.end()) {
            return false;
        }
        if (analyzers.categories.empty()) {
            return true;
        }
        const std::string_view category = lpa::to_string(analyzer.category());
        return std::ranges::find(analyzers.categories, category) != analyzers.categories.end();
    }

    Result<std::optional<Severity>, Error> Config::fail_on_level() const {
        return engine::parse_fail_on(report.fail_on);
    }

    Result<OutputFormat, Error> Config::output_format() const {
        if (const auto format = output_format_from_string(report.format)) {
            return Result<OutputFormat, Error>::success(*format);
        }
        return Result<OutputFormat, Error>::failure(
            Error::invalid_argument("Unknown output format", report.format));
    }

    fs::path Config::resolve(const std::string& path) const {
        const fs::path candidate(path);
        if (candidate.is_absolute()) {
            return candidate;
        }
        return fs::path(general.base_path) / candidate;
    }

    const char* to_string(const OutputFormat format) noexcept {
        switch (format) {
            case OutputFormat::Text:     return "text";
            case OutputFormat::Json:     return "json";
            case OutputFormat::Markdown: return "markdown";
        }
        return "unknown";
    }

    std::optional<OutputFormat> output_format_from_string(const std::string_view str) noexcept {
        if (str == "text") return OutputFormat::Text;
        if (str == "json") return OutputFormat::Json;
        if (str == "markdown" || str == "md") return OutputFormat::Markdown;
        return std::nullopt;
    }

}  // namespace lpa::config
