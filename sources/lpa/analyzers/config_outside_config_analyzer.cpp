//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/config_outside_config_analyzer.hpp"

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace lpa::analyzers
{
    namespace {

        constexpr std::array<std::string_view, 4> ALLOWED_HOSTS = {
            "example.com", "laravel.com", "github.com", "stackoverflow.com",
        };

        class ConfigHardcodeVisitor final : public scope::FileVisitor {
        public:
            explicit ConfigHardcodeVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                const auto value = syntax::string_literal(node);
                if (!value) {
                    return;
                }

                if (is_hardcoded_url(*value)) {
                    context_.report(
                        ConfigOutsideConfigAnalyzer::ID, node, Severity::Medium,
                        "hardcoded-url",
                        "Hardcoded URL: \"" + value->substr(0, 50) + "\"",
                        "Move URLs to a config file (e.g. config/services.php) and read them with "
                        "config('services.api.url') instead of hardcoding");
                }
                if (looks_like_secret(*value)) {
                    context_.report(
                        ConfigOutsideConfigAnalyzer::ID, node, Severity::High,
                        "hardcoded-secret",
                        "Possible hardcoded API key or secret detected",
                        "Never hardcode API keys in source code. Use environment variables through config files: "
                        "config('services.api.key')");
                }
            }

        private:
            FileContext& context_;
        };

    }  // namespace

    bool is_hardcoded_url(const std::string_view value) {
        if (!string_utils::starts_with(value, "http://") && !string_utils::starts_with(value, "https://")) {
            return false;
        }
        return std::ranges::none_of(ALLOWED_HOSTS, [value](const std::string_view host) {
            return string_utils::contains(value, host);
        });
    }

    bool looks_like_secret(const std::string_view value) noexcept {
        return value.size() > 30 && std::ranges::all_of(value, [](const char c) {
            return std::isalnum(static_cast<unsigned char>(c)) != 0;
        });
    }

    bool ConfigOutsideConfigAnalyzer::should_analyze(const std::string_view relative_path) const {
        return !path_utils::is_within_directory(relative_path, "config");
    }

    std::unique_ptr<scope::FileVisitor> ConfigOutsideConfigAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<ConfigHardcodeVisitor>(context);
    }

    void register_config_outside_config_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<ConfigOutsideConfigAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
