//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/workspace.hpp"
#include "lpa/cli/commands/command.hpp"

#include "lpa/analyzers/analyzer.hpp"
#include "lpa/config/path_filter.hpp"
#include "lpa/models/registry_cache.hpp"
#include "lpa/utils/logging.hpp"

#include <algorithm>
#include <memory>

namespace lpa::cli
{
    Result<config::Config, Error> load_config(const ParsedArgs& args) {
        const std::optional<std::string> project =
            args.positional().empty() ? std::nullopt : std::optional<std::string>(args.positional().front());

        std::optional<fs::path> config_path;
        if (auto explicit_path = args.get("config")) {
            config_path = fs::path(*explicit_path);
        } else {
            const fs::path candidate = fs::path(project.value_or(".")) / config::DEFAULT_CONFIG_FILE;
            if (std::error_code ec; fs::is_regular_file(candidate, ec)) {
                config_path = candidate;
            }
        }

        config::Config config;
        if (config_path) {
            auto loaded = config::Config::load_from_file(*config_path);
            if (loaded.is_err()) {
                return loaded;
            }
            config = std::move(loaded).value();

            // A relative base_path is relative to the configuration file
            if (!project && fs::path(config.general.base_path).is_relative()) {
                config.general.base_path = (config_path->parent_path() / config.general.base_path).lexically_normal().string();
                if (config.general.base_path.empty()) {
                    config.general.base_path = ".";
                }
            }
        }

        if (project) {
            config.general.base_path = *project;
        }
        return Result<config::Config, Error>::success(std::move(config));
    }

    void init_logging(const config::Config& config, const bool verbose) {
        auto logging_config = config.logging;
        if (verbose) {
            const auto level = spdlog::level::from_str(logging_config.level);
            if (level > spdlog::level::info) {
                logging_config.level = "info";
            }
        }
        logging::init(logging_config);
    }

    models::ModelRegistry build_registry(const config::Config& config) {
        std::vector<fs::path> model_dirs;
        for (const auto& path : config.models.paths) {
            model_dirs.push_back(config.resolve(path));
        }

        models::RegistryOptions options;
        options.base_classes = config.models.base_classes;
        options.table_mappings = config.models.table_mappings;

        if (!config.models.cache) {
            return models::load_registry(model_dirs, options);
        }
        const models::RegistryCache cache(config.resolve(config.models.cache_dir));
        return models::load_registry(model_dirs, options, &cache);
    }

    Result<engine::AnalysisReport, Error> run_analysis(const config::Config& config, const RunOptions& options) {
        using ResultType = Result<engine::AnalysisReport, Error>;
        const auto& registry = analyzers::AnalyzerRegistry::instance();

        for (const auto& id : options.only) {
            if (registry.get_analyzer(id) == nullptr) {
                return ResultType::failure(Error::invalid_argument("Unknown analyzer", id));
            }
        }
        for (const auto& id : config.analyzers.disabled) {
            if (registry.get_analyzer(id) == nullptr) {
                logging::get()->warn("analyzers.disabled names unknown analyzer \"{}\"", id);
            }
        }

        std::vector<std::string> enabled;
        std::vector<analyzers::AnalyzerSettings> settings;
        engine::EngineOptions engine_options;
        for (const auto* analyzer : registry.list_analyzers()) {
            const std::string id(analyzer->id());
            const bool selected = options.only.empty()
                ? config.is_enabled(*analyzer)
                : std::ranges::find(options.only, id) != options.only.end();
            if (!selected) {
                continue;
            }

            auto analyzer_settings = config.settings_for(id);
            if (analyzer_settings.has("excluded_paths")) {
                auto excluded = analyzer_settings.get_strings("excluded_paths");
                if (excluded.is_err()) {
                    return ResultType::failure(excluded.error());
                }
                engine_options.excluded_paths.emplace(id, std::move(excluded).value());
            }

            enabled.push_back(id);
            settings.push_back(std::move(analyzer_settings));
        }

        if (enabled.empty()) {
            return ResultType::failure(Error::invalid_argument("No analyzer selected"));
        }

        auto created = engine::create_analyzers(registry, enabled, settings);
        if (created.is_err()) {
            return ResultType::failure(created.error());
        }

        auto files = config::PathFilter::from_config(config).collect();
        if (files.is_err()) {
            return ResultType::failure(files.error());
        }

        const auto model_registry = build_registry(config);
        logging::get()->info("Model registry: {} models", model_registry.size());

        engine_options.threads = options.threads.value_or(static_cast<unsigned int>(config.general.threads));
        engine_options.dont_report.insert(config.report.dont_report.begin(), config.report.dont_report.end());

        const engine::AnalysisEngine engine(model_registry, std::move(engine_options));
        return ResultType::success(engine.run(created.value(), files.value()));
    }

}  // namespace lpa::cli
