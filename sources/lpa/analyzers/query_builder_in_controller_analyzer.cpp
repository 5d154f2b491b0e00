//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/query_builder_in_controller_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <set>
#include <string>
#include <utility>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        constexpr std::array<std::string_view, 7> DB_METHODS = {
            "table", "select", "insert", "update", "delete", "statement", "raw",
        };

        constexpr std::array<std::string_view, 41> QUERY_METHODS = {
            "where", "whereIn", "whereNotIn", "whereBetween", "whereNull", "whereNotNull",
            "whereHas", "whereDoesntHave", "orWhere", "whereRaw", "havingRaw",
            "join", "leftJoin", "rightJoin", "crossJoin", "joinSub",
            "groupBy", "having", "orderBy", "orderByRaw", "select", "selectRaw", "addSelect",
            "limit", "offset", "skip", "take", "union", "unionAll", "when", "unless",
            "with", "withCount", "withSum", "withAvg", "withMin", "withMax",
            "sum", "avg", "min", "max",
        };

        constexpr std::array<std::string_view, 5> JOIN_METHODS = {
            "join", "leftJoin", "rightJoin", "crossJoin", "joinSub",
        };

        constexpr std::array<std::string_view, 4> RAW_METHODS = {
            "whereRaw", "havingRaw", "selectRaw", "orderByRaw",
        };

        constexpr std::array<std::string_view, 8> AGGREGATE_METHODS = {
            "sum", "avg", "min", "max", "count", "withCount", "withSum", "withAvg",
        };

        constexpr std::array<std::string_view, 4> CONDITION_METHODS = {
            "where", "whereIn", "whereHas", "orWhere",
        };

        std::string_view query_type(const std::string_view method) noexcept {
            if (vocab::contains(JOIN_METHODS, method)) return "join";
            if (vocab::contains(RAW_METHODS, method)) return "raw_query";
            if (vocab::contains(AGGREGATE_METHODS, method)) return "aggregation";
            if (vocab::contains(CONDITION_METHODS, method)) return "complex_where";
            return "query_builder";
        }

        Severity severity_for(const std::string_view type) noexcept {
            if (type == "raw_query" || type == "join") {
                return Severity::High;
            }
            if (type == "complex_where" || type == "aggregation") {
                return Severity::Medium;
            }
            return Severity::Low;
        }

        class ControllerQueryVisitor final : public scope::FileVisitor {
        public:
            explicit ControllerQueryVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                const auto* method = context_.scopes().current_method();
                if (method == nullptr || context_.scopes().current_class() == nullptr) {
                    return;
                }

                if (syntax::is_static_call(node)) {
                    const auto scope = node.child_by_field("scope").text();
                    const auto name = syntax::call_name(node);
                    if (scope::is_db_facade(scope) && vocab::contains(DB_METHODS, name)) {
                        const std::string_view type = name == "raw" ? "raw_query" : "db_facade";
                        emit(node, *method, "DB::" + std::string(name) + "()", type);
                        return;
                    }
                }
                if ((syntax::is_member_call(node) || syntax::is_static_call(node)) &&
                    vocab::contains(QUERY_METHODS, syntax::call_name(node))) {
                    const auto name = syntax::call_name(node);
                    emit(node, *method, std::string(name) + "()", query_type(name));
                }
            }

        private:
            void emit(const syntax::SyntaxNode& call, const scope::Scope& method,
                      const std::string& query, const std::string_view type) {
                if (!seen_.emplace(method.name, query).second) {
                    return;
                }

                context_.report(
                    QueryBuilderInControllerAnalyzer::ID, call, severity_for(type),
                    std::string(type),
                    "Direct database query '" + query + "' used in controller method '" + method.name + "'",
                    "Move query logic into a repository, a query object or a model scope and call it from "
                    "the controller. Controllers should only coordinate the request and the response.",
                    {
                        {"method", method.name},
                        {"query", query},
                        {"type", std::string(type)},
                    });
            }

            FileContext& context_;
            std::set<std::pair<std::string, std::string>> seen_;
        };

    }  // namespace

    bool QueryBuilderInControllerAnalyzer::should_analyze(const std::string_view relative_path) const {
        return path_utils::has_directory(relative_path, "Controllers") ||
               string_utils::ends_with(relative_path, "Controller.php");
    }

    std::unique_ptr<scope::FileVisitor> QueryBuilderInControllerAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<ControllerQueryVisitor>(context);
    }

    void register_query_builder_in_controller_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<QueryBuilderInControllerAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
