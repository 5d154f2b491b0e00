//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_COMMAND_HPP
#define LPA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommands of the lpa executable and their option parser.
 *
 * Every command takes an optional project path as its only positional
 * argument. -h/--help, -v/--verbose, -q/--quiet and --json are accepted
 * by all commands.
 */

#include "lpa/error.hpp"
#include "lpa/result.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lpa::cli
{
    /**
     * One --name option of a command. An option without a value name is
     * a flag.
     */
    struct OptionSpec {
        std::string name;
        char short_name = 0;
        std::string value_name;
        std::string description;
        std::string default_value;

        [[nodiscard]] bool is_flag() const noexcept { return value_name.empty(); }
    };

    class ParsedArgs;

    /**
     * Parses the arguments that follow the command name.
     */
    [[nodiscard]] Result<ParsedArgs, Error> parse_arguments(const std::vector<std::string>& args,
                                                            const std::vector<OptionSpec>& options);

    class ParsedArgs {
    public:
        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;

        /**
         * Returns a non-negative integer option, nullopt when absent or
         * not a number.
         */
        [[nodiscard]] std::optional<std::size_t> get_count(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;

        /**
         * Splits a comma-separated option value, dropping empty items.
         */
        [[nodiscard]] std::vector<std::string> get_list(const std::string& name) const;

        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        friend Result<ParsedArgs, Error> parse_arguments(const std::vector<std::string>& args,
                                                         const std::vector<OptionSpec>& options);

        std::map<std::string, std::string> values_;
        std::set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,
        Normal,
        Verbose
    };

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Usage line and examples shown by --help.
         */
        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<OptionSpec> arguments() const { return {}; }

        /**
         * Checks option values before execute(). Returns the problem, or
         * an empty string when the arguments are usable.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        /**
         * Runs the command and returns the process exit status.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        void print_help() const;

    protected:
        /**
         * Applies --verbose, --quiet and --json.
         */
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ == Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return json_; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        bool json_ = false;
    };

    /**
     * The subcommands known to main(), looked up by name.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;

        /// Commands sorted by name.
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    inline constexpr int EXIT_OK = 0;
    inline constexpr int EXIT_ISSUES = 1;       // Issues at or above fail_on
    inline constexpr int EXIT_ERROR = 2;        // Usage, configuration or I/O error

}  // namespace lpa::cli

#endif //LPA_COMMAND_HPP
