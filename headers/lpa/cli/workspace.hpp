//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_WORKSPACE_HPP
#define LPA_WORKSPACE_HPP

/**
 * @file workspace.hpp
 * @brief Steps shared by the commands that analyze a project.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/config/config.hpp"
#include "lpa/engine/engine.hpp"
#include "lpa/models/model_registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lpa::cli
{
    class ParsedArgs;

    /**
     * Loads the configuration for a command.
     *
     * The project directory is the first positional argument, or the
     * current directory. The configuration is --config when given,
     * otherwise <project>/lpa.toml when it exists, otherwise the
     * defaults. The project directory always overrides general.base_path
     * when given on the command line.
     */
    [[nodiscard]] Result<config::Config, Error> load_config(const ParsedArgs& args);

    /**
     * Installs the logger described by the configuration. --verbose
     * lowers the level to info unless the configuration is already finer.
     */
    void init_logging(const config::Config& config, bool verbose);

    /**
     * Builds the model registry from models.paths below the base path.
     */
    [[nodiscard]] models::ModelRegistry build_registry(const config::Config& config);

    /**
     * Analysis inputs that the command line can override.
     */
    struct RunOptions {
        std::vector<std::string> only;      ///< Rule ids; empty = every enabled analyzer
        std::optional<unsigned int> threads;
    };

    /**
     * Discovers files, builds the registry, configures analyzers and runs them.
     */
    [[nodiscard]] Result<engine::AnalysisReport, Error> run_analysis(const config::Config& config,
                                                                    const RunOptions& options);

}  // namespace lpa::cli

#endif //LPA_WORKSPACE_HPP
