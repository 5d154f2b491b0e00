//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/commands/command.hpp"
#include "lpa/cli/formatter.hpp"
#include "lpa/cli/workspace.hpp"

#include "lpa/models/registry_cache.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace lpa::cli
{
    /**
     * Models command - shows how model classes map to tables.
     */
    class ModelsCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "models";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show the model-to-table registry of a project";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: lpa models [PATH] [OPTIONS]\n"
                   "\n"
                   "Scans models.paths and prints each model class with the table it\n"
                   "maps to. Tables computed at runtime are shown as (dynamic).\n"
                   "\n"
                   "Examples:\n"
                   "  lpa models\n"
                   "  lpa models --json\n"
                   "  lpa models --clear-cache";
        }

        [[nodiscard]] std::vector<OptionSpec> arguments() const override {
            return {
                {"config", 'c', "FILE", "Configuration file (default: <PATH>/lpa.toml)"},
                {"clear-cache", 0, "", "Delete cached registries and exit"},
            };
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return EXIT_OK;
            }
            apply_common_flags(args);

            auto loaded = load_config(args);
            if (loaded.is_err()) {
                print_error(loaded.error().to_string());
                return EXIT_ERROR;
            }
            const auto config = std::move(loaded).value();
            init_logging(config, is_verbose());

            if (args.get_flag("clear-cache")) {
                return clear_cache(config);
            }

            const auto registry = build_registry(config);
            const auto entries = registry.entries();
            const fs::path base = config.general.base_path;

            if (is_json()) {
                nlohmann::json models = nlohmann::json::array();
                for (const auto& entry : entries) {
                    models.push_back({
                        {"class", entry.class_name},
                        {"table", entry.table.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.table)},
                        {"parent", entry.parent},
                        {"file", path_utils::make_relative(entry.file, base).generic_string()},
                    });
                }
                std::cout << models.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
                return EXIT_OK;
            }

            if (entries.empty()) {
                print("No models found in " + string_utils::join(config.models.paths, ", "));
                return EXIT_OK;
            }

            Table table({"Model", "Table", "File"});
            for (const auto& entry : entries) {
                table.add_row({
                    entry.class_name,
                    entry.table.empty() ? std::string("(dynamic)") : entry.table,
                    path_utils::make_relative(entry.file, base).generic_string(),
                });
            }
            table.render(std::cout);

            if (!is_quiet()) {
                std::cout << "\n" << format_count(entries.size()) << " models\n";
            }
            return EXIT_OK;
        }

    private:
        int clear_cache(const config::Config& config) const {
            const models::RegistryCache cache(config.resolve(config.models.cache_dir));
            auto removed = cache.clear();
            if (removed.is_err()) {
                print_error(removed.error().to_string());
                return EXIT_ERROR;
            }
            print("Removed " + std::to_string(removed.value()) + " cache files from " + cache.directory().string());
            return EXIT_OK;
        }
    };

    namespace {
        struct ModelsCommandRegistrar {
            ModelsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ModelsCommand>()
                );
            }
        } models_registrar;
    }
}  // namespace lpa::cli
