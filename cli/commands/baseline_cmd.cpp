//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/commands/command.hpp"
#include "lpa/cli/formatter.hpp"
#include "lpa/cli/workspace.hpp"

#include "lpa/report/baseline.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>

namespace lpa::cli
{
    /**
     * Baseline command - records the current issues so later runs ignore them.
     */
    class BaselineCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "baseline";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Record current issues in a baseline file";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: lpa baseline [PATH] [OPTIONS]\n"
                   "\n"
                   "Runs every enabled analyzer and writes the issues it finds to the\n"
                   "baseline file. 'lpa analyze' skips issues recorded there.\n"
                   "\n"
                   "Examples:\n"
                   "  lpa baseline\n"
                   "  lpa baseline --merge\n"
                   "  lpa baseline --output build/lpa-baseline.json";
        }

        [[nodiscard]] std::vector<OptionSpec> arguments() const override {
            return {
                {"config", 'c', "FILE", "Configuration file (default: <PATH>/lpa.toml)"},
                {"output", 'o', "FILE", "Baseline file (default: report.baseline_file)"},
                {"merge", 'm', "", "Keep entries already in the baseline file"},
                {"only", 0, "IDS", "Record only these analyzers (comma-separated ids)"},
                {"parallel", 'j', "N", "Number of worker threads (0 = hardware)"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (auto problem = Command::validate(args); !problem.empty()) {
                return problem;
            }
            if (args.has("parallel") && !args.get_count("parallel")) {
                return "--parallel expects a non-negative number";
            }
            return "";
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

            RunOptions run_options;
            run_options.only = args.get_list("only");
            if (auto threads = args.get_count("parallel")) {
                run_options.threads = static_cast<unsigned int>(*threads);
            }

            auto analysis = run_analysis(config, run_options);
            if (analysis.is_err()) {
                print_error(analysis.error().to_string());
                return EXIT_ERROR;
            }

            const fs::path output = args.has("output")
                ? fs::path(*args.get("output"))
                : config.resolve(config.report.baseline_file);

            auto baseline = report::Baseline::from_report(analysis.value());

            std::size_t kept = 0;
            if (std::error_code ec; args.get_flag("merge") && fs::exists(output, ec)) {
                auto existing = report::Baseline::load(output);
                if (existing.is_err()) {
                    print_error("Cannot merge baseline: " + existing.error().to_string());
                    return EXIT_ERROR;
                }
                kept = baseline.merge(existing.value());
            }

            if (auto saved = baseline.save(output, std::chrono::system_clock::now()); saved.is_err()) {
                print_error(saved.error().to_string());
                return EXIT_ERROR;
            }

            if (is_json()) {
                const nlohmann::json summary = {
                    {"file", output.generic_string()},
                    {"entries", baseline.size()},
                    {"merged", kept},
                };
                std::cout << summary.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
                return EXIT_OK;
            }

            print("Baseline written to " + output.string() + " (" + format_count(baseline.size()) + " entries)");
            if (kept > 0) {
                print_verbose("Kept " + std::to_string(kept) + " entries from the previous baseline");
            }
            return EXIT_OK;
        }
    };

    namespace {
        struct BaselineCommandRegistrar {
            BaselineCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<BaselineCommand>()
                );
            }
        } baseline_registrar;
    }
}  // namespace lpa::cli
