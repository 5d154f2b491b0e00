//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/commands/command.hpp"
#include "lpa/cli/formatter.hpp"

#include "lpa/analyzers/analyzer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>

namespace lpa::cli
{
    /**
     * List command - shows the available analyzers.
     */
    class ListCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "list";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List available analyzers";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: lpa list [OPTIONS]\n"
                   "\n"
                   "Examples:\n"
                   "  lpa list\n"
                   "  lpa list --category security\n"
                   "  lpa list --json";
        }

        [[nodiscard]] std::vector<OptionSpec> arguments() const override {
            return {
                {"category", 0, "NAMES", "Show only analyzers of these categories"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            for (const auto& category : args.get_list("category")) {
                if (!category_from_string(category)) {
                    return "Unknown category: " + category;
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return EXIT_OK;
            }
            apply_common_flags(args);

            const auto categories = args.get_list("category");
            std::vector<const analyzers::IAnalyzer*> selected;
            for (const auto* analyzer : analyzers::AnalyzerRegistry::instance().list_analyzers()) {
                const bool wanted = categories.empty() || std::ranges::any_of(categories, [&](const std::string& c) {
                    return category_from_string(c) == analyzer->category();
                });
                if (wanted) {
                    selected.push_back(analyzer);
                }
            }

            if (is_json()) {
                nlohmann::json list = nlohmann::json::array();
                for (const auto* analyzer : selected) {
                    list.push_back({
                        {"id", analyzer->id()},
                        {"name", analyzer->name()},
                        {"category", to_string(analyzer->category())},
                        {"severity", to_string(analyzer->severity())},
                        {"description", analyzer->description()},
                    });
                }
                std::cout << list.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
                return EXIT_OK;
            }

            Table table({"ID", "Category", "Severity", "Description"});
            for (const auto* analyzer : selected) {
                table.add_row({
                    std::string(analyzer->id()),
                    to_string(analyzer->category()),
                    to_string(analyzer->severity()),
                    std::string(analyzer->description()),
                });
            }
            table.render(std::cout);

            if (!is_quiet()) {
                std::cout << "\n" << selected.size() << " analyzers\n";
            }
            return EXIT_OK;
        }
    };

    namespace {
        struct ListCommandRegistrar {
            ListCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ListCommand>()
                );
            }
        } list_registrar;
    }
}  // namespace lpa::cli
