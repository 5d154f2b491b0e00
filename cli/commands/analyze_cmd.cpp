//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/commands/command.hpp"
#include "lpa/cli/formatter.hpp"
#include "lpa/cli/workspace.hpp"

#include "lpa/exporters/exporter.hpp"
#include "lpa/report/baseline.hpp"
#include "lpa/utils/logging.hpp"

#include <iostream>

namespace lpa::cli
{
    /**
     * Analyze command - runs the analyzers over a Laravel project.
     */
    class AnalyzeCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Analyze a Laravel project for architectural, performance and security anti-patterns";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: lpa analyze [PATH] [OPTIONS]\n"
                   "\n"
                   "Exit status is 1 when a reported issue is at or above the fail-on level.\n"
                   "\n"
                   "Examples:\n"
                   "  lpa analyze\n"
                   "  lpa analyze ../shop --only eloquent-n-plus-one,sql-injection\n"
                   "  lpa analyze --format markdown --output report.md\n"
                   "  lpa analyze --category security --fail-on critical";
        }

        [[nodiscard]] std::vector<OptionSpec> arguments() const override {
            return {
                {"config", 'c', "FILE", "Configuration file (default: <PATH>/lpa.toml)"},
                {"format", 'f', "FORMAT", "Output format (text, json, markdown)"},
                {"output", 'o', "FILE", "Write the report to a file"},
                {"only", 0, "IDS", "Run only these analyzers (comma-separated ids)"},
                {"category", 0, "NAMES", "Run only analyzers of these categories"},
                {"baseline", 'b', "FILE", "Ignore issues recorded in this baseline"},
                {"no-baseline", 0, "", "Do not apply report.baseline_file"},
                {"fail-on", 0, "LEVEL", "Minimum severity that fails (never, low, medium, high, critical)"},
                {"max-issues", 0, "N", "Issues shown per analyzer in text output (0 = all)", "0"},
                {"no-color", 0, "", "Disable colored output"},
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
            if (!args.get_count("max-issues")) {
                return "--max-issues expects a non-negative number";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return EXIT_OK;
            }
            apply_common_flags(args);
            if (args.get_flag("no-color")) {
                colors::set_enabled(false);
            }

            auto loaded = load_config(args);
            if (loaded.is_err()) {
                print_error(loaded.error().to_string());
                return EXIT_ERROR;
            }
            auto config = std::move(loaded).value();

            if (auto format = args.get("format")) {
                config.report.format = *format;
            }
            if (is_json()) {
                config.report.format = "json";
            }
            if (auto fail_on = args.get("fail-on")) {
                config.report.fail_on = *fail_on;
            }
            if (args.has("category")) {
                config.analyzers.categories = args.get_list("category");
            }
            if (auto valid = config.validate(); valid.is_err()) {
                print_error(valid.error().to_string());
                return EXIT_ERROR;
            }

            init_logging(config, is_verbose());

            RunOptions run_options;
            run_options.only = args.get_list("only");
            if (auto threads = args.get_count("parallel")) {
                run_options.threads = static_cast<unsigned int>(*threads);
            }

            print_verbose("Analyzing " + config.general.base_path);

            auto analysis = run_analysis(config, run_options);
            if (analysis.is_err()) {
                print_error(analysis.error().to_string());
                return EXIT_ERROR;
            }
            auto report = std::move(analysis).value();

            if (const int status = apply_baseline(args, config, report); status != EXIT_OK) {
                return status;
            }

            const auto format = config.output_format().value();
            const auto fail_on = config.fail_on_level().value();

            if (format == config::OutputFormat::Text) {
                if (!args.has("output")) {
                    if (!is_quiet()) {
                        const ReportPrinter printer(std::cout);
                        printer.print_report(report, *args.get_count("max-issues"));
                    }
                } else if (const int status = write_export(exporters::ExportFormat::Markdown, *args.get("output"), report);
                           status != EXIT_OK) {
                    return status;
                }
            } else {
                const auto export_format = format == config::OutputFormat::Json
                    ? exporters::ExportFormat::JSON
                    : exporters::ExportFormat::Markdown;
                if (const int status = write_export(export_format, args.get("output").value_or(""), report);
                    status != EXIT_OK) {
                    return status;
                }
            }

            return report.exceeds(fail_on) ? EXIT_ISSUES : EXIT_OK;
        }

    private:
        int apply_baseline(const ParsedArgs& args, const config::Config& config, engine::AnalysisReport& report) const {
            if (args.get_flag("no-baseline")) {
                return EXIT_OK;
            }

            fs::path baseline_path;
            if (auto explicit_path = args.get("baseline")) {
                baseline_path = *explicit_path;
            } else if (!config.report.baseline_file.empty()) {
                baseline_path = config.resolve(config.report.baseline_file);
                if (std::error_code ec; !fs::exists(baseline_path, ec)) {
                    return EXIT_OK;
                }
            } else {
                return EXIT_OK;
            }

            auto baseline = report::Baseline::load(baseline_path);
            if (baseline.is_err()) {
                print_error("Cannot load baseline: " + baseline.error().to_string());
                return EXIT_ERROR;
            }

            const auto dropped = baseline.value().filter(report);
            print_verbose("Baseline " + baseline_path.string() + " suppressed " + std::to_string(dropped) + " issues");
            return EXIT_OK;
        }

        int write_export(const exporters::ExportFormat format, const std::string& output,
                         const engine::AnalysisReport& report) const {
            auto exporter = exporters::ExporterFactory::create(format);
            if (exporter.is_err()) {
                print_error(exporter.error().to_string());
                return EXIT_ERROR;
            }

            const exporters::ExportOptions options;
            if (output.empty()) {
                auto content = exporter.value()->export_to_stream(std::cout, report, options);
                if (content.is_err()) {
                    print_error(content.error().to_string());
                    return EXIT_ERROR;
                }
                return EXIT_OK;
            }

            if (auto written = exporter.value()->export_to_file(output, report, options); written.is_err()) {
                print_error(written.error().to_string());
                return EXIT_ERROR;
            }
            print("Report written to " + output);
            return EXIT_OK;
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace lpa::cli
