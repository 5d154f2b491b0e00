//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/service_container_resolution_analyzer.hpp"

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <utility>

namespace lpa::analyzers
{
    namespace {

        using syntax::SyntaxNode;

        bool matches_any(const std::string_view text, const std::vector<std::string>& patterns) {
            return std::ranges::any_of(patterns, [text](const std::string& pattern) {
                return path_utils::glob_match(text, pattern);
            });
        }

        bool is_service_provider_class(const SyntaxNode& class_node) {
            return string_utils::ends_with(syntax::base_class_name(class_node), "ServiceProvider");
        }

        bool declares_service_provider(const SyntaxNode& root) {
            for (const auto& child : root.named_children()) {
                if (child.is("class_declaration") && is_service_provider_class(child)) {
                    return true;
                }
                if (child.is("namespace_definition")) {
                    if (const auto body = child.child_by_field("body"); body && declares_service_provider(body)) {
                        return true;
                    }
                }
            }
            return false;
        }

        enum class ArgumentType { None, Class, String, Variable, Unknown };

        const char* type_name(const ArgumentType type) noexcept {
            switch (type) {
                case ArgumentType::None: return "none";
                case ArgumentType::Class: return "class";
                case ArgumentType::String: return "string";
                case ArgumentType::Variable: return "variable";
                case ArgumentType::Unknown: return "unknown";
            }
            return "unknown";
        }

        ArgumentType argument_type(const SyntaxNode& call) {
            const auto first = syntax::first_argument(call);
            if (!first) {
                return syntax::argument_values(call).empty() ? ArgumentType::None : ArgumentType::Unknown;
            }
            if (first.is("class_constant_access_expression")) {
                return ArgumentType::Class;
            }
            if (syntax::is_string(first)) {
                return ArgumentType::String;
            }
            if (first.is("variable_name")) {
                return ArgumentType::Variable;
            }
            return ArgumentType::Unknown;
        }

        bool is_plain_function(const SyntaxNode& node, const std::string_view name) noexcept {
            if (!syntax::is_function_call(node)) {
                return false;
            }
            auto function = node.child_by_field("function").text();
            if (!function.empty() && function.front() == '\\') {
                function.remove_prefix(1);
            }
            return function == name;
        }

        bool is_container_instance(const SyntaxNode& node) noexcept {
            return syntax::is_static_call(node) &&
                   string_utils::contains(node.child_by_field("scope").text(), "Container") &&
                   syntax::call_name(node) == "getInstance";
        }

        std::string recommendation_for(const std::string& pattern, const std::string& location) {
            const std::string base = "Manual service container resolution detected using '" + pattern +
                                     "' in '" + location + "'. ";
            if (string_utils::contains(pattern, "bind") || string_utils::contains(pattern, "singleton") ||
                string_utils::contains(pattern, "instance") || string_utils::contains(pattern, "scoped")) {
                return base + "Container bindings should be registered in a ServiceProvider's register() method, "
                              "e.g. $this->app->bind(Interface::class, Implementation::class).";
            }
            if (string_utils::starts_with(pattern, "new ")) {
                return base + "Consider using constructor injection to let Laravel's container manage dependencies.";
            }
            return base + "Manual resolution is a service locator anti-pattern that hides dependencies and makes "
                          "testing difficult. Use constructor injection, or method injection for controller actions.";
        }

        class ServiceContainerVisitor final : public scope::FileVisitor {
        public:
            ServiceContainerVisitor(const ServiceContainerResolutionAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer)
                , context_(context)
                , provider_file_(declares_service_provider(context.tree().root())) {}

            void enter(const SyntaxNode& node) override {
                if (provider_file_ || in_whitelisted_class()) {
                    return;
                }

                if (syntax::is_member_call(node)) {
                    check_member_call(node);
                } else if (syntax::is_static_call(node)) {
                    check_static_call(node);
                } else if (syntax::is_function_call(node)) {
                    check_function_call(node);
                } else if (node.is("object_creation_expression")) {
                    check_instantiation(node);
                }
            }

        private:
            bool in_whitelisted_class() const {
                const auto* cls = context_.scopes().current_class();
                if (cls == nullptr || cls->kind == scope::ScopeKind::AnonymousClass) {
                    return false;
                }
                return analyzer_.is_whitelisted_class(cls->name) ||
                       analyzer_.is_whitelisted_class(cls->qualified_name);
            }

            bool in_closure() const {
                for (const auto* scope = &context_.scopes().current(); scope != nullptr; scope = scope->parent) {
                    if (scope->kind == scope::ScopeKind::Closure) {
                        return true;
                    }
                    if (scope->is_class()) {
                        return false;
                    }
                }
                return false;
            }

            std::string location() const {
                const auto* cls = context_.scopes().current_class();
                const std::string class_name = cls == nullptr ? "Unknown" : cls->name.empty() ? "Anonymous" : cls->name;
                if (const auto* method = context_.scopes().current_method(); method != nullptr && !method->name.empty()) {
                    return class_name + "::" + method->name;
                }
                return cls == nullptr ? "global scope" : class_name;
            }

            void check_member_call(const SyntaxNode& call) {
                const auto object = syntax::unwrap_parentheses(call.child_by_field("object"));
                if (!call.child_by_field("name").is("name")) {
                    return;
                }
                const std::string method(syntax::call_name(call));

                if (is_plain_function(object, "app")) {
                    if (analyzer_.is_whitelisted_method(method)) {
                        return;
                    }
                    if (analyzer_.is_resolution_method(method) && !in_closure()) {
                        add_resolution(call, "app()->" + method + "()");
                    }
                    if (method == "bind" || method == "singleton" || method == "instance" || method == "scoped") {
                        add(call, "app()->" + method + "()", Severity::High, "binding");
                    }
                    return;
                }

                if (is_container_instance(object) && analyzer_.is_resolution_method(method) && !in_closure()) {
                    add_resolution(call, "Container::getInstance()->" + method + "()");
                }
            }

            void check_static_call(const SyntaxNode& call) {
                const auto scope = call.child_by_field("scope");
                if (!scope.is("name") && !scope.is("qualified_name")) {
                    return;
                }
                if (string_utils::basename(scope.text()) != "App" || !call.child_by_field("name").is("name")) {
                    return;
                }
                const std::string method(syntax::call_name(call));
                if (analyzer_.is_resolution_method(method) && !in_closure()) {
                    add_resolution(call, "App::" + method + "()");
                }
            }

            void check_function_call(const SyntaxNode& call) {
                if (is_plain_function(call, "resolve")) {
                    if (!in_closure()) {
                        add_resolution(call, "resolve()");
                    }
                    return;
                }
                if (!is_plain_function(call, "app") || syntax::argument_values(call).empty() || in_closure()) {
                    return;
                }
                if (const auto service = syntax::string_literal(syntax::first_argument(call));
                    service && analyzer_.is_whitelisted_service(*service)) {
                    return;
                }
                add_resolution(call, "app()");
            }

            void check_instantiation(const SyntaxNode& creation) {
                if (creation.named_child_count() == 0) {
                    return;
                }
                const auto type = creation.named_child(0);
                if ((!type.is("name") && !type.is("qualified_name")) ||
                    !analyzer_.detects_instantiation_of(type.text()) || in_closure()) {
                    return;
                }
                add(creation, "new " + std::string(type.text()) + "()", Severity::Low, "instantiation");
            }

            void add_resolution(const SyntaxNode& call, std::string pattern) {
                const auto type = argument_type(call);
                add(call, std::move(pattern), type == ArgumentType::String ? Severity::High : Severity::Medium,
                    type_name(type));
            }

            void add(const SyntaxNode& node, std::string pattern, const Severity severity, const std::string& argument) {
                if (!seen_.emplace(node.start_line(), pattern).second) {
                    return;
                }
                const auto where = location();
                const auto* cls = context_.scopes().current_class();
                context_.report(
                    ServiceContainerResolutionAnalyzer::ID, node, severity,
                    argument == "binding" ? "container-binding" : "service-locator",
                    "Manual service resolution in '" + where + "': " + pattern,
                    recommendation_for(pattern, where),
                    {{"pattern", pattern},
                     {"location", where},
                     {"class", cls == nullptr ? std::string("Unknown") : cls->name},
                     {"argument_type", argument}});
            }

            const ServiceContainerResolutionAnalyzer& analyzer_;
            FileContext& context_;
            bool provider_file_;
            std::set<std::pair<std::size_t, std::string>> seen_;
        };

    }  // namespace

    ServiceContainerResolutionAnalyzer::ServiceContainerResolutionAnalyzer()
        : whitelist_dirs_{"tests", "database/migrations", "database/seeders", "database/factories", "routes"}
        , whitelist_classes_{"*Command", "*Seeder", "DatabaseSeeder", "*Job", "*Listener",
                             "*Middleware", "*Observer", "*Factory", "*Handler"}
        , whitelist_methods_{
              "environment", "isLocal", "isProduction", "runningInConsole", "runningUnitTests",
              "bound", "has", "resolved", "isShared", "isAlias", "call", "tagged",
              "when", "needs", "give", "giveTagged", "giveConfig", "extend", "alias",
              "terminating", "booted", "booting",
              "basePath", "configPath", "databasePath", "resourcePath", "storagePath",
              "publicPath", "langPath", "bootstrapPath",
              "getLocale", "setLocale", "isLocale", "currentLocale", "version", "name", "abort",
              "flush", "forgetInstance", "forgetInstances", "forgetScopedInstances"}
        , whitelist_services_{
              "config", "request", "log", "cache", "session", "view", "validator", "translator",
              "events", "files", "router", "db", "auth", "hash", "cookie", "queue", "mail", "url",
              "redirect", "blade.compiler", "encrypter"}
        , instantiation_patterns_{"*Service", "*Repository", "*Handler"} {}

    Result<void, Error> ServiceContainerResolutionAnalyzer::configure(const AnalyzerSettings& settings) {
        const std::array<std::pair<std::string_view, std::vector<std::string>*>, 5> lists = {{
            {"whitelist_dirs", &whitelist_dirs_},
            {"whitelist_classes", &whitelist_classes_},
            {"whitelist_methods", &whitelist_methods_},
            {"whitelist_services", &whitelist_services_},
            {"manual_instantiation_patterns", &instantiation_patterns_},
        }};
        for (const auto& [key, target] : lists) {
            auto values = settings.get_strings(key, *target);
            if (values.is_err()) {
                return Result<void, Error>::failure(values.error());
            }
            *target = std::move(values).value();
        }

        auto psr_get = settings.get_bool("detect_psr_get", false);
        if (psr_get.is_err()) {
            return Result<void, Error>::failure(psr_get.error());
        }
        detect_psr_get_ = psr_get.value();

        auto instantiation = settings.get_bool("detect_manual_instantiation", false);
        if (instantiation.is_err()) {
            return Result<void, Error>::failure(instantiation.error());
        }
        detect_manual_instantiation_ = instantiation.value();

        return Result<void, Error>::success();
    }

    bool ServiceContainerResolutionAnalyzer::should_analyze(const std::string_view relative_path) const {
        if (string_utils::ends_with(relative_path, "ServiceProvider.php")) {
            return false;
        }
        return std::ranges::none_of(whitelist_dirs_, [relative_path](const std::string& dir) {
            return path_utils::is_within_directory(relative_path, dir);
        });
    }

    bool ServiceContainerResolutionAnalyzer::is_whitelisted_class(const std::string_view name) const {
        return !name.empty() && matches_any(name, whitelist_classes_);
    }

    bool ServiceContainerResolutionAnalyzer::is_whitelisted_method(const std::string_view method) const {
        return std::ranges::find(whitelist_methods_, method) != whitelist_methods_.end();
    }

    bool ServiceContainerResolutionAnalyzer::is_whitelisted_service(const std::string_view service) const {
        return std::ranges::find(whitelist_services_, service) != whitelist_services_.end();
    }

    bool ServiceContainerResolutionAnalyzer::is_resolution_method(const std::string_view method) const noexcept {
        return method == "make" || method == "makeWith" || method == "resolve" || (detect_psr_get_ && method == "get");
    }

    bool ServiceContainerResolutionAnalyzer::detects_instantiation_of(const std::string_view class_name) const {
        return detect_manual_instantiation_ &&
               (matches_any(class_name, instantiation_patterns_) ||
                matches_any(string_utils::basename(class_name), instantiation_patterns_));
    }

    std::unique_ptr<scope::FileVisitor> ServiceContainerResolutionAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<ServiceContainerVisitor>(*this, context);
    }

    void register_service_container_resolution_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<ServiceContainerResolutionAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
