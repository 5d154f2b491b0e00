//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/silent_failure_analyzer.hpp"
#include "lpa/analyzers/generic_exception_catch_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <functional>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;
        using syntax::SyntaxNode;

        constexpr std::array<std::string_view, 3> BROAD_TYPES = {"Throwable", "Exception", "Error"};

        constexpr std::array<std::string_view, 33> INTENTIONAL_PHRASES = {
            "intentional", "deliberately", "on purpose", "expected to fail", "expected exception",
            "safe to ignore", "safely ignore", "can be ignored", "may be ignored", "optional",
            "not critical", "non-critical", "best effort", "best-effort", "fire and forget",
            "fire-and-forget", "no action needed", "no action required", "nothing to do", "noop",
            "no-op", "@suppress", "@ignore", "phpstan-ignore", "psalm-suppress", "swallow",
            "don't care", "doesn't matter", "not important", "ignore silently", "ignored on purpose",
            "safe to skip", "can be skipped",
        };

        constexpr std::array<std::string_view, 9> LOGGER_METHODS = {
            "error", "warning", "info", "debug", "log", "critical", "alert", "emergency", "notice",
        };

        constexpr std::array<std::string_view, 7> HANDLER_FRAGMENTS = {
            "log", "error", "exception", "report", "handle", "notify", "fail",
        };

        constexpr std::array<std::string_view, 3> MONITORING_CLASSES = {"Raygun", "Rollbar", "Honeybadger"};

        constexpr std::array<std::string_view, 7> FALLBACK_VARIABLES = {
            "default", "fallback", "backup", "cached", "empty", "placeholder", "alternative",
        };

        constexpr std::array<std::string_view, 9> FALLBACK_CALLS = {
            "default", "fallback", "backup", "empty", "cached", "retry", "attempt", "recover", "restore",
        };

        constexpr std::array<std::string_view, 5> FALLBACK_STATIC_CLASSES = {
            "Cache", "Config", "Session", "Storage", "Redis",
        };

        template<std::size_t N>
        bool contains_fragment(const std::string_view text, const std::array<std::string_view, N>& fragments) {
            const std::string lowered = string_utils::to_lower(text);
            return std::ranges::any_of(fragments, [&lowered](const std::string_view fragment) {
                return string_utils::contains(lowered, fragment);
            });
        }

        bool matches_any(const std::string_view text, const std::vector<std::string>& patterns) {
            return std::ranges::any_of(patterns, [text](const std::string& pattern) {
                return path_utils::glob_match(text, pattern);
            });
        }

        bool any_in_subtree(const SyntaxNode& root, const std::function<bool(const SyntaxNode&)>& predicate) {
            std::vector<SyntaxNode> pending{root};
            while (!pending.empty()) {
                const auto node = pending.back();
                pending.pop_back();
                if (predicate(node)) {
                    return true;
                }
                for (const auto& child : node.named_children()) {
                    pending.push_back(child);
                }
            }
            return false;
        }

        bool is_static_name(const SyntaxNode& node) noexcept {
            return node.is("name") || node.is("qualified_name");
        }

        std::string_view function_name(const SyntaxNode& call) noexcept {
            const auto function = call.child_by_field("function");
            auto text = function.text();
            if (!text.empty() && text.front() == '\\') {
                text.remove_prefix(1);
            }
            return text;
        }

        bool is_session_target(const SyntaxNode& object) {
            const auto node = syntax::unwrap_parentheses(object);
            if (syntax::is_function_call(node) && function_name(node) == "session") {
                return true;
            }
            return node.is("variable_name") && string_utils::contains(string_utils::to_lower(node.text()), "session");
        }

        bool is_logging_call(const SyntaxNode& node) {
            if (syntax::is_static_call(node)) {
                const auto scope = node.child_by_field("scope").text();
                const auto short_name = string_utils::basename(scope);
                const auto method = syntax::call_name(node);
                return short_name == "Log" ||
                       (short_name == "DB" && string_utils::iequals(method, "rollback")) ||
                       string_utils::contains(scope, "Sentry") ||
                       string_utils::contains(scope, "Bugsnag") ||
                       vocab::contains(MONITORING_CLASSES, short_name);
            }

            if (syntax::is_function_call(node)) {
                const auto name = function_name(node);
                if (name == "logger" || name == "report" || name == "abort" ||
                    name == "abort_if" || name == "abort_unless") {
                    return true;
                }
                if (string_utils::contains(name, "Sentry\\captureException") ||
                    string_utils::contains(name, "Bugsnag\\")) {
                    return true;
                }
                // rescue($callback, $default, true) reports the exception
                if (name == "rescue") {
                    const auto arguments = syntax::argument_values(node);
                    return arguments.size() >= 3 && string_utils::iequals(arguments[2].text(), "true");
                }
                return false;
            }

            if (syntax::is_member_call(node)) {
                const auto method = syntax::call_name(node);
                if (vocab::contains(LOGGER_METHODS, method) || method == "captureException" ||
                    method == "notifyException" || method == "report" || method == "notify") {
                    return true;
                }
                const auto object = node.child_by_field("object");
                if ((method == "flash" || method == "put" || method == "push") && is_session_target(object)) {
                    return true;
                }
                return object.text() == "$this" && contains_fragment(method, HANDLER_FRAGMENTS);
            }
            return false;
        }

        bool is_meaningful_alternative(const SyntaxNode& expr) noexcept {
            const auto node = syntax::unwrap_parentheses(expr);
            return syntax::is_call(node) || node.is("object_creation_expression");
        }

        bool is_fallback_assignment(const SyntaxNode& assignment) {
            const auto left = assignment.child_by_field("left");
            if (left.is("variable_name") && contains_fragment(left.text(), FALLBACK_VARIABLES)) {
                return true;
            }

            const auto right = syntax::unwrap_parentheses(assignment.child_by_field("right"));
            if (syntax::is_member_call(right)) {
                return contains_fragment(syntax::call_name(right), FALLBACK_CALLS);
            }
            if (syntax::is_static_call(right)) {
                const auto short_name = string_utils::basename(right.child_by_field("scope").text());
                if (!vocab::contains(FALLBACK_STATIC_CLASSES, short_name)) {
                    return false;
                }
                const auto method = syntax::call_name(right);
                return (method == "get" && syntax::argument_values(right).size() >= 2) ||
                       method == "remember" || method == "rememberForever" || method == "pull";
            }
            if (syntax::is_function_call(right)) {
                return contains_fragment(function_name(right), FALLBACK_CALLS);
            }
            if (right.is("binary_expression") && syntax::operator_of(right) == "??") {
                return is_meaningful_alternative(right.child_by_field("right"));
            }
            if (right.is("conditional_expression")) {
                return is_meaningful_alternative(right.child_by_field("alternative"));
            }
            return right.is("object_creation_expression");
        }

        bool is_graceful_fallback(const SyntaxNode& node) {
            if (node.is("return_statement") || node.is("continue_statement") || node.is("break_statement")) {
                return true;
            }
            if (!node.is("expression_statement") || node.named_child_count() == 0) {
                return false;
            }
            const auto expr = node.named_child(0);
            if (expr.is("assignment_expression")) {
                return is_fallback_assignment(expr);
            }
            return syntax::is_function_call(expr) && function_name(expr) == "rescue";
        }

        bool is_throw(const SyntaxNode& node) noexcept {
            return node.is("throw_expression") || node.is("throw_statement");
        }

        bool is_comment_only(const SyntaxNode& body) {
            return std::ranges::all_of(body.named_children(), [](const SyntaxNode& child) {
                return child.is("comment");
            });
        }

        bool has_intentional_comment(const SyntaxNode& clause, const SyntaxNode& body) {
            std::vector<SyntaxNode> comments;
            for (const auto& child : body.named_children()) {
                if (child.is("comment")) {
                    comments.push_back(child);
                }
            }
            if (const auto previous = clause.prev_named_sibling(); previous.is("comment")) {
                comments.push_back(previous);
            }
            return std::ranges::any_of(comments, [](const SyntaxNode& comment) {
                return contains_fragment(comment.text(), INTENTIONAL_PHRASES);
            });
        }

        bool is_inside_catch(const SyntaxNode& node) {
            for (auto current = node.parent(); current; current = current.parent()) {
                if (current.is("catch_clause")) {
                    return true;
                }
            }
            return false;
        }

        bool is_dynamic_call(const SyntaxNode& expr) noexcept {
            if (syntax::is_function_call(expr)) {
                return !is_static_name(expr.child_by_field("function"));
            }
            if (syntax::is_static_call(expr)) {
                return !is_static_name(expr.child_by_field("scope"));
            }
            if (syntax::is_member_call(expr)) {
                return !expr.child_by_field("name").is("name");
            }
            return false;
        }

        class SilentFailureVisitor final : public scope::FileVisitor {
        public:
            SilentFailureVisitor(const SilentFailureAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (node.is("catch_clause") && !in_whitelisted_class()) {
                    check_catch(node);
                } else if (node.is("error_suppression_expression") && !in_whitelisted_class()) {
                    check_suppression(node);
                }
            }

        private:
            bool in_whitelisted_class() const {
                for (const auto* scope = &context_.scopes().current(); scope != nullptr; scope = scope->parent) {
                    if (scope->is_class() && !scope->name.empty() && analyzer_.is_whitelisted_class(scope->name)) {
                        return true;
                    }
                }
                return false;
            }

            void check_catch(const SyntaxNode& clause) {
                const auto types = caught_types(clause);

                std::vector<std::string_view> broad;
                for (const auto type : types) {
                    if (const auto short_name = string_utils::basename(type); vocab::contains(BROAD_TYPES, short_name)) {
                        broad.push_back(short_name);
                    }
                }
                if (broad.empty() && std::ranges::any_of(types, [this](const std::string_view type) {
                        return analyzer_.is_whitelisted_exception(type);
                    })) {
                    return;
                }

                const auto body = clause.child_by_field("body");
                if (body.is_null() || is_comment_only(body)) {
                    if (!has_intentional_comment(clause, body)) {
                        context_.report(
                            SilentFailureAnalyzer::ID, clause, Severity::High,
                            "empty-catch",
                            "Empty catch block silently swallows exceptions",
                            "Never use empty catch blocks. At minimum, log the exception. If you truly need to "
                            "ignore an exception, add a comment explaining why");
                    }
                    return;
                }

                const bool rethrows = any_in_subtree(body, is_throw);
                if (!broad.empty() && !rethrows) {
                    const auto listed = string_utils::join(broad, "|");
                    context_.report(
                        SilentFailureAnalyzer::ID, clause, Severity::High,
                        "broad-catch",
                        "Catching " + listed + " is overly broad and can mask fatal errors",
                        "Catch specific exception types instead of " + listed +
                        ". Broad catches hide programming errors like TypeError, ArgumentCountError",
                        {{"types", listed}});
                }

                const auto variable = clause.child_by_field("name");
                if (variable && any_in_subtree(body, [&variable](const SyntaxNode& node) {
                        return node.is("variable_name") && node.text() == variable.text();
                    })) {
                    return;
                }

                const bool handled = any_in_subtree(body, [](const SyntaxNode& node) {
                    return is_logging_call(node) || is_graceful_fallback(node);
                });
                if (!handled && !rethrows) {
                    context_.report(
                        SilentFailureAnalyzer::ID, clause, Severity::Medium,
                        "unlogged-catch",
                        "Catch block does not log exception or rethrow",
                        "Always log caught exceptions using Log::error(), report(), or rethrow them. "
                        "Silent failures make debugging extremely difficult");
                }
            }

            void check_suppression(const SyntaxNode& node) {
                const auto expr = syntax::unwrap_parentheses(node.named_child(0));
                if (analyzer_.allows_suppression(expr)) {
                    return;
                }

                std::string message = "Error suppression operator (@) hides errors";
                auto severity = Severity::Medium;
                if (is_inside_catch(node)) {
                    message = "Error suppression operator (@) inside catch block creates double silencing";
                    severity = Severity::High;
                } else if (is_dynamic_call(expr)) {
                    message = "Dynamic error suppression is particularly dangerous";
                    severity = Severity::High;
                }

                context_.report(
                    SilentFailureAnalyzer::ID, node, severity,
                    "error-suppression",
                    std::move(message),
                    severity == Severity::High
                        ? "Dynamic or nested error suppression is highly discouraged. Use explicit try-catch with logging"
                        : "Avoid using @ operator. Handle errors explicitly with try-catch or check return values");
            }

            const SilentFailureAnalyzer& analyzer_;
            FileContext& context_;
        };

    }  // namespace

    SilentFailureAnalyzer::SilentFailureAnalyzer()
        : whitelist_dirs_{"tests", "database/seeders", "database/factories"}
        , whitelist_classes_{"*Test", "*TestCase", "*Seeder", "DatabaseSeeder"}
        , whitelist_exceptions_{"ModelNotFoundException", "NotFoundException", "NotFoundHttpException",
                                "ValidationException"}
        , suppression_functions_{"unlink", "fopen", "file_get_contents", "mkdir", "rmdir"}
        , suppression_static_methods_{"Storage::delete", "Storage::deleteDirectory", "File::delete",
                                      "File::deleteDirectory"}
        , suppression_instance_methods_{"delete", "close", "unlink"} {}

    Result<void, Error> SilentFailureAnalyzer::configure(const AnalyzerSettings& settings) {
        const std::array<std::pair<std::string_view, std::vector<std::string>*>, 6> lists = {{
            {"whitelist_dirs", &whitelist_dirs_},
            {"whitelist_classes", &whitelist_classes_},
            {"whitelist_exceptions", &whitelist_exceptions_},
            {"whitelist_error_suppression_functions", &suppression_functions_},
            {"whitelist_error_suppression_static_methods", &suppression_static_methods_},
            {"whitelist_error_suppression_instance_methods", &suppression_instance_methods_},
        }};
        for (const auto& [key, target] : lists) {
            auto values = settings.get_strings(key, *target);
            if (values.is_err()) {
                return Result<void, Error>::failure(values.error());
            }
            *target = std::move(values).value();
        }
        return Result<void, Error>::success();
    }

    bool SilentFailureAnalyzer::should_analyze(const std::string_view relative_path) const {
        return std::ranges::none_of(whitelist_dirs_, [relative_path](const std::string& dir) {
            return path_utils::is_within_directory(relative_path, dir);
        });
    }

    bool SilentFailureAnalyzer::is_whitelisted_class(const std::string_view class_name) const {
        return matches_any(class_name, whitelist_classes_);
    }

    bool SilentFailureAnalyzer::is_whitelisted_exception(const std::string_view type) const {
        return matches_any(type, whitelist_exceptions_) || matches_any(string_utils::basename(type), whitelist_exceptions_);
    }

    bool SilentFailureAnalyzer::allows_suppression(const SyntaxNode& expr) const {
        if (syntax::is_function_call(expr)) {
            if (!is_static_name(expr.child_by_field("function"))) {
                return false;
            }
            const auto name = function_name(expr);
            return matches_any(name, suppression_functions_) ||
                   matches_any(string_utils::basename(name), suppression_functions_);
        }
        if (syntax::is_static_call(expr)) {
            const auto scope = expr.child_by_field("scope");
            if (!is_static_name(scope) || !expr.child_by_field("name").is("name")) {
                return false;
            }
            const std::string method(syntax::call_name(expr));
            const std::string full = std::string(scope.text()) + "::" + method;
            const std::string short_form = std::string(string_utils::basename(scope.text())) + "::" + method;
            return matches_any(full, suppression_static_methods_) || matches_any(short_form, suppression_static_methods_);
        }
        if (syntax::is_member_call(expr)) {
            if (!expr.child_by_field("name").is("name")) {
                return false;
            }
            return matches_any(syntax::call_name(expr), suppression_instance_methods_);
        }
        return false;
    }

    std::unique_ptr<scope::FileVisitor> SilentFailureAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<SilentFailureVisitor>(*this, context);
    }

    void register_silent_failure_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<SilentFailureAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
