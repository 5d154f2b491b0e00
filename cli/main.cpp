//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/commands/command.hpp"

#include "lpa/analyzers/all_analyzers.hpp"
#include "lpa/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << lpa::PROJECT_NAME << " " << lpa::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << lpa::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : lpa::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun '" << lpa::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

    void print_version() {
        std::cout << lpa::PROJECT_SHORT_NAME << " " << lpa::VERSION_STRING << "\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        lpa::analyzers::register_all_analyzers();

        if (argc < 2) {
            print_usage();
            return lpa::cli::EXIT_ERROR;
        }

        const std::string command_name = argv[1];
        if (command_name == "-h" || command_name == "--help" || command_name == "help") {
            print_usage();
            return lpa::cli::EXIT_OK;
        }
        if (command_name == "--version" || command_name == "version") {
            print_version();
            return lpa::cli::EXIT_OK;
        }

        auto* command = lpa::cli::CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "Unknown command: " << command_name << "\n\n";
            print_usage();
            return lpa::cli::EXIT_ERROR;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        const auto parsed = lpa::cli::parse_arguments(args, command->arguments());
        if (parsed.is_err()) {
            std::cerr << "Error: " << parsed.error().message() << ": " << parsed.error().context().value_or("") << "\n";
            std::cerr << command->usage() << "\n";
            return lpa::cli::EXIT_ERROR;
        }

        if (!parsed.value().get_flag("help")) {
            if (const auto problem = command->validate(parsed.value()); !problem.empty()) {
                std::cerr << "Error: " << problem << "\n";
                return lpa::cli::EXIT_ERROR;
            }
        }

        return command->execute(parsed.value());

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return lpa::cli::EXIT_ERROR;
    }
}
