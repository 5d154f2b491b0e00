//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/logic_in_routes_analyzer.hpp"
#include "lpa/analyzers/query_patterns.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        constexpr std::string_view DB_QUERIES = "database queries";
        constexpr std::string_view BUSINESS_LOGIC = "complex business logic";

        constexpr std::array<std::string_view, 10> BUSINESS_LOGIC_FUNCTIONS = {
            "dispatch", "dispatch_sync", "dispatch_now", "event", "report",
            "rescue", "broadcast", "app", "resolve", "retry",
        };

        constexpr std::array<std::string_view, 6> BUSINESS_LOGIC_FACADES = {
            "Mail", "Notification", "Queue", "Event", "Bus", "Broadcast",
        };

        constexpr std::array<std::string_view, 4> SERVICE_CONTAINER_METHODS = {
            "make", "makeWith", "call", "get",
        };

        constexpr std::array<std::string_view, 6> STATIC_QUERY_METHODS = {
            "where", "find", "all", "first", "create", "query",
        };

        constexpr std::array<std::string_view, 15> QUERY_METHODS = {
            "where", "find", "all", "first", "create", "query", "findOrFail",
            "firstOrFail", "get", "pluck", "count", "exists", "doesntExist",
            "with", "without",
        };

        /// Builder methods with no collection counterpart.
        constexpr std::array<std::string_view, 16> SQL_ONLY_METHODS = {
            "orWhere", "whereIn", "whereNotIn", "whereBetween", "whereNull",
            "join", "leftJoin", "rightJoin", "crossJoin", "having", "havingRaw",
            "groupBy", "union", "unionAll", "lockForUpdate", "sharedLock",
        };

        constexpr std::array<std::string_view, 27> UTILITY_CLASSES = {
            "Carbon", "Collection", "Validator", "Cache", "Log", "Session", "Cookie",
            "Request", "Response", "View", "Config", "Str", "Arr", "File", "Storage",
            "Hash", "Crypt", "Route", "URL", "Redirect", "DB", "App", "Auth", "Gate",
            "Password", "RateLimiter", "Schema",
        };

        constexpr std::array<std::string_view, 4> ARITHMETIC_OPERATORS = {"+", "-", "*", "/"};
        constexpr std::array<std::string_view, 4> COMPOUND_ASSIGNMENTS = {"+=", "-=", "*=", "/="};

        bool is_route_facade(const FileContext& context, const std::string_view written) {
            if (written == "Route" || written == "\\Route") {
                return true;
            }
            return context.scopes().resolve_class(written) == "Illuminate\\Support\\Facades\\Route";
        }

        /// Simple capitalized class name as written: User, not App\Models\User.
        bool is_plain_class_name(const std::string_view name) noexcept {
            if (name.empty() || !std::isupper(static_cast<unsigned char>(name.front()))) {
                return false;
            }
            for (const char c : name) {
                if (!std::isalnum(static_cast<unsigned char>(c))) {
                    return false;
                }
            }
            return true;
        }

        struct RouteClosure {
            syntax::SyntaxNode node;
            bool db_queries = false;
            bool business_logic = false;
            int if_depth = 0;
            bool seen_loop = false;
        };

        class RouteLogicVisitor final : public scope::FileVisitor {
        public:
            RouteLogicVisitor(const LogicInRoutesAnalyzer& analyzer, FileContext& context)
                : analyzer_(analyzer), context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (syntax::is_closure(node) && route_closures_.contains(node.start_byte())) {
                    closures_.push_back({node});
                    return;
                }
                if (syntax::is_static_call(node) || syntax::is_member_call(node)) {
                    collect_route_closures(node);
                }
                if (!closures_.empty()) {
                    inspect(closures_.back(), node);
                }
            }

            void leave(const syntax::SyntaxNode& node) override {
                if (closures_.empty()) {
                    return;
                }
                auto& closure = closures_.back();
                if (closure.node == node) {
                    check(closure);
                    closures_.pop_back();
                } else if (node.is("if_statement")) {
                    --closure.if_depth;
                }
            }

        private:
            void collect_route_closures(const syntax::SyntaxNode& call) {
                const auto chain = syntax::decompose_chain(call);
                if (chain.root_kind != syntax::ChainRoot::StaticClass || !is_route_facade(context_, chain.root)) {
                    return;
                }
                if (syntax::call_name(call) == "group") {
                    return;
                }
                for (const auto& value : syntax::argument_values(call)) {
                    if (syntax::is_closure(value)) {
                        route_closures_.insert(value.start_byte());
                    }
                }
            }

            void inspect(RouteClosure& closure, const syntax::SyntaxNode& node) {
                if (!closure.db_queries && is_db_query(node)) {
                    closure.db_queries = true;
                }

                if (node.is("if_statement")) {
                    if (++closure.if_depth > 1) {
                        closure.business_logic = true;
                    }
                } else if (syntax::is_loop(node)) {
                    closure.seen_loop = true;
                }

                if (!closure.business_logic && is_business_logic(closure, node)) {
                    closure.business_logic = true;
                }
            }

            [[nodiscard]] bool is_db_query(const syntax::SyntaxNode& node) const {
                if (syntax::is_static_call(node)) {
                    const auto chain = syntax::decompose_chain(node);
                    if (is_db_rooted(chain)) {
                        return true;
                    }
                    return vocab::contains(STATIC_QUERY_METHODS, syntax::call_name(node)) &&
                           is_model_rooted(context_, chain);
                }
                if (syntax::is_member_call(node)) {
                    if (vocab::contains(SQL_ONLY_METHODS, syntax::call_name(node))) {
                        return true;
                    }
                    return is_outermost_call(node) && is_query_call(context_, node);
                }
                return false;
            }

            [[nodiscard]] bool is_business_logic(const RouteClosure& closure, const syntax::SyntaxNode& node) const {
                if (syntax::is_function_call(node)) {
                    return vocab::contains(BUSINESS_LOGIC_FUNCTIONS, syntax::call_name(node));
                }

                if (syntax::is_static_call(node)) {
                    const auto written = node.child_by_field("scope").text();
                    const auto short_name = string_utils::basename(written);
                    const auto method = syntax::call_name(node);

                    if (vocab::contains(BUSINESS_LOGIC_FACADES, short_name)) {
                        return true;
                    }
                    if (short_name == "App" && vocab::contains(SERVICE_CONTAINER_METHODS, method)) {
                        return true;
                    }
                    // User::sendWelcomeEmail(): a domain operation rather than a query
                    return is_plain_class_name(written) &&
                           !vocab::contains(UTILITY_CLASSES, written) &&
                           !vocab::contains(QUERY_METHODS, method);
                }

                if (syntax::is_member_call(node) && is_outermost_call(node)) {
                    std::size_t length = 0;
                    for (const auto& link : syntax::decompose_chain(node).links) {
                        if (syntax::is_member_call(link.call)) {
                            ++length;
                        }
                    }
                    if (length >= analyzer_.method_chain_threshold()) {
                        return true;
                    }
                }

                if (closure.seen_loop || closure.if_depth > 1) {
                    if (node.is("binary_expression")) {
                        return vocab::contains(ARITHMETIC_OPERATORS, syntax::operator_of(node));
                    }
                    if (node.is("augmented_assignment_expression")) {
                        return vocab::contains(COMPOUND_ASSIGNMENTS, syntax::operator_of(node));
                    }
                }
                return false;
            }

            void check(const RouteClosure& closure) {
                const std::size_t line_count = closure.node.end_line() - closure.node.start_line() + 1;

                std::vector<std::string> problems;
                Severity severity = Severity::Low;
                std::string code;
                std::string recommendation;

                if (closure.db_queries) {
                    problems.emplace_back(DB_QUERIES);
                    severity = Severity::Critical;
                    code = "route-has-db-queries";
                    recommendation = "Database queries should not be in route files. Move this logic to a controller "
                                     "method and use repositories or services for data access.";
                }
                if (closure.business_logic) {
                    problems.emplace_back(BUSINESS_LOGIC);
                    if (code.empty()) {
                        severity = Severity::High;
                        code = "route-has-business-logic";
                        recommendation = "Complex business logic should be in service classes or controllers, not "
                                         "in route files. Route files should only define routes.";
                    }
                }
                if (line_count > analyzer_.max_closure_lines()) {
                    std::ostringstream problem;
                    problem << line_count << " lines (max: " << analyzer_.max_closure_lines() << ")";
                    problems.push_back(problem.str());
                    if (code.empty()) {
                        severity = Severity::Medium;
                        code = "route-closure-too-long";
                        recommendation = "Move route logic to a controller method or single-action controller. "
                                         "Route files should only define routes.";
                    }
                }

                if (problems.empty()) {
                    return;
                }

                context_.report(
                    LogicInRoutesAnalyzer::ID, closure.node, severity,
                    std::move(code),
                    "Route closure contains " + string_utils::join(problems, ", "),
                    std::move(recommendation),
                    {
                        {"problems", problems},
                        {"line_count", line_count},
                        {"has_db_queries", closure.db_queries},
                        {"has_business_logic", closure.business_logic},
                    });
            }

            const LogicInRoutesAnalyzer& analyzer_;
            FileContext& context_;
            std::set<std::uint32_t> route_closures_;
            std::vector<RouteClosure> closures_;
        };

    }  // namespace

    Result<void, Error> LogicInRoutesAnalyzer::configure(const AnalyzerSettings& settings) {
        auto lines = settings.get_count("max_closure_lines", DEFAULT_MAX_CLOSURE_LINES, 1);
        if (lines.is_err()) {
            return Result<void, Error>::failure(lines.error());
        }
        max_closure_lines_ = lines.value();

        auto chain = settings.get_count("method_chain_threshold", DEFAULT_METHOD_CHAIN_THRESHOLD, 1);
        if (chain.is_err()) {
            return Result<void, Error>::failure(chain.error());
        }
        method_chain_threshold_ = chain.value();

        return Result<void, Error>::success();
    }

    bool LogicInRoutesAnalyzer::should_analyze(const std::string_view relative_path) const {
        return path_utils::has_directory(relative_path, "routes");
    }

    std::unique_ptr<scope::FileVisitor> LogicInRoutesAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<RouteLogicVisitor>(*this, context);
    }

    void register_logic_in_routes_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<LogicInRoutesAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
