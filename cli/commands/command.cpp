//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/cli/commands/command.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <iostream>

namespace lpa::cli
{
    namespace {

        struct CommonFlag {
            char short_name;
            std::string_view name;
            std::string_view description;
        };

        constexpr std::array<CommonFlag, 4> COMMON_FLAGS = {{
            {'h', "help", "Show this help message"},
            {'v', "verbose", "Log debug messages and progress"},
            {'q', "quiet", "Only show errors"},
            {0, "json", "Print results as JSON"},
        }};

        const CommonFlag* common_flag(const std::string_view name) {
            const auto it = std::ranges::find(COMMON_FLAGS, name, &CommonFlag::name);
            return it == COMMON_FLAGS.end() ? nullptr : &*it;
        }

        const CommonFlag* common_flag(const char short_name) {
            const auto it = std::ranges::find(COMMON_FLAGS, short_name, &CommonFlag::short_name);
            return it == COMMON_FLAGS.end() ? nullptr : &*it;
        }

        void print_option(const char short_name, const std::string& long_form, const std::string_view description) {
            std::cout << "  ";
            if (short_name != 0) {
                std::cout << "-" << short_name << ", ";
            } else {
                std::cout << "    ";
            }
            std::cout << "--" << std::left << std::setw(20) << long_form << description;
        }

    }  // namespace

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = values_.find(name); it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<std::size_t> ParsedArgs::get_count(const std::string& name) const {
        const auto it = values_.find(name);
        if (it == values_.end()) {
            return std::nullopt;
        }

        const auto& text = it->second;
        std::size_t count = 0;
        const auto* end = text.data() + text.size();
        if (const auto [ptr, ec] = std::from_chars(text.data(), end, count); ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return count;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    std::vector<std::string> ParsedArgs::get_list(const std::string& name) const {
        std::vector<std::string> items;
        const auto it = values_.find(name);
        if (it == values_.end()) {
            return items;
        }

        for (const auto& part : string_utils::split(it->second, ',')) {
            if (auto item = string_utils::trim(part); !item.empty()) {
                items.emplace_back(item);
            }
        }
        return items;
    }

    std::string Command::usage() const {
        return "Usage: lpa " + std::string(name()) + " [PATH] [OPTIONS]";
    }

    std::string Command::validate(const ParsedArgs& args) const {
        if (args.positional().size() > 1) {
            return "Only one project path may be given";
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n";
        std::cout << usage() << "\n\n";

        if (const auto options = arguments(); !options.empty()) {
            std::cout << "Options:\n";
            for (const auto& option : options) {
                print_option(option.short_name,
                             option.is_flag() ? option.name : option.name + " " + option.value_name,
                             option.description);
                if (!option.default_value.empty()) {
                    std::cout << " (default: " << option.default_value << ")";
                }
                std::cout << "\n";
            }
            std::cout << "\n";
        }

        std::cout << "Common options:\n";
        for (const auto& flag : COMMON_FLAGS) {
            print_option(flag.short_name, std::string(flag.name), flag.description);
            std::cout << "\n";
        }
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        }
        json_ = args.get_flag("json");
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ == Verbosity::Verbose) {
            std::cerr << msg << "\n";
        }
    }

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
        }
        return nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        std::ranges::sort(result, {}, &Command::name);
        return result;
    }

    Result<ParsedArgs, Error> parse_arguments(const std::vector<std::string>& args,
                                              const std::vector<OptionSpec>& options) {
        using ParseResult = Result<ParsedArgs, Error>;

        ParsedArgs parsed;
        for (const auto& option : options) {
            if (!option.default_value.empty()) {
                parsed.values_[option.name] = option.default_value;
            }
        }

        const auto by_name = [&options](const std::string_view name) -> const OptionSpec* {
            const auto it = std::ranges::find_if(options, [name](const OptionSpec& o) { return o.name == name; });
            return it == options.end() ? nullptr : &*it;
        };
        const auto by_short = [&options](const char short_name) -> const OptionSpec* {
            const auto it = std::ranges::find(options, short_name, &OptionSpec::short_name);
            return it == options.end() ? nullptr : &*it;
        };

        bool options_ended = false;
        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg.empty()) {
                continue;
            }
            if (options_ended || arg[0] != '-' || arg.size() == 1) {
                parsed.positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_ended = true;
                continue;
            }

            if (arg[1] == '-') {
                std::string name = arg.substr(2);
                std::optional<std::string> value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto* option = by_name(name);
                if (option == nullptr) {
                    if (common_flag(name) == nullptr) {
                        return ParseResult::failure(Error::invalid_argument("Unknown option", "--" + name));
                    }
                    parsed.flags_.insert(name);
                    continue;
                }
                if (option->is_flag()) {
                    parsed.flags_.insert(name);
                    continue;
                }
                if (!value && i + 1 < args.size()) {
                    value = args[++i];
                }
                if (!value || value->empty()) {
                    return ParseResult::failure(Error::invalid_argument("Option requires a value", "--" + name));
                }
                parsed.values_[name] = *value;
                continue;
            }

            // Bundled short options; one that takes a value consumes the rest.
            for (std::size_t j = 1; j < arg.size(); ++j) {
                const char c = arg[j];
                const auto* option = by_short(c);
                if (option == nullptr) {
                    const auto* flag = common_flag(c);
                    if (flag == nullptr) {
                        return ParseResult::failure(Error::invalid_argument("Unknown option", std::string("-") + c));
                    }
                    parsed.flags_.insert(std::string(flag->name));
                    continue;
                }
                if (option->is_flag()) {
                    parsed.flags_.insert(option->name);
                    continue;
                }

                std::string value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return ParseResult::failure(Error::invalid_argument("Option requires a value", std::string("-") + c));
                }
                parsed.values_[option->name] = value;
                break;
            }
        }

        return ParseResult::success(std::move(parsed));
    }

}  // namespace lpa::cli
