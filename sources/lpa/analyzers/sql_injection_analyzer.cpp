//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/sql_injection_analyzer.hpp"

#include "lpa/scope/vocabulary.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <array>
#include <string>
#include <vector>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        constexpr std::array<std::string_view, 7> DB_RAW_METHODS = {
            "raw", "select", "selectOne", "statement", "insert", "update", "delete",
        };

        constexpr std::array<std::string_view, 8> RAW_BUILDER_METHODS = {
            "whereRaw", "orWhereRaw", "havingRaw", "orHavingRaw",
            "orderByRaw", "selectRaw", "groupByRaw", "fromRaw",
        };

        constexpr std::array<std::string_view, 8> REQUEST_READERS = {
            "input", "get", "all", "query", "post", "cookie", "header", "route",
        };

        constexpr std::array<std::string_view, 4> SUPERGLOBALS = {
            "$_GET", "$_POST", "$_REQUEST", "$_COOKIE",
        };

        /// Returns the argument holding the SQL text of a native query function.
        syntax::SyntaxNode native_sql_argument(const syntax::SyntaxNode& call, const std::string_view name) {
            const auto values = syntax::argument_values(call);
            if (values.empty()) {
                return {};
            }
            // mysqli_query($link, $sql), pg_query([$connection,] $sql), mysql_query($sql[, $link])
            if (name == "mysqli_query") {
                return values.size() > 1 ? values[1] : syntax::SyntaxNode{};
            }
            if (name == "pg_query") {
                return values.size() > 1 ? values[1] : values[0];
            }
            return values[0];
        }

        bool is_vulnerable(const syntax::SyntaxNode& sql) {
            if (sql.is_null()) {
                return false;
            }
            return syntax::is_dynamic_string(sql) || reads_user_input(sql);
        }

        class SqlInjectionVisitor final : public scope::FileVisitor {
        public:
            explicit SqlInjectionVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (syntax::is_static_call(node)) {
                    check_static(node);
                } else if (syntax::is_member_call(node)) {
                    check_builder(node);
                } else if (syntax::is_function_call(node)) {
                    check_native(node);
                }
            }

        private:
            void check_static(const syntax::SyntaxNode& call) {
                const auto scope = call.child_by_field("scope");
                if (!scope::is_db_facade(scope.text())) {
                    return;
                }
                const auto method = syntax::call_name(call);
                const std::string label = "DB::" + std::string(method) + "()";

                if (method == "unprepared") {
                    emit(call, label,
                         "Avoid DB::unprepared(). Use prepared statements with DB::select(), DB::insert() and "
                         "friends with parameter binding.");
                    return;
                }
                if (!vocab::contains(DB_RAW_METHODS, method) || !is_vulnerable(syntax::first_argument(call))) {
                    return;
                }
                emit(call, label,
                     "Use parameter binding: " + label.substr(0, label.size() - 1) +
                     "'column = ?', [$value]) instead of concatenation.");
            }

            void check_builder(const syntax::SyntaxNode& call) {
                const auto method = syntax::call_name(call);
                if (!vocab::contains(RAW_BUILDER_METHODS, method) || !is_vulnerable(syntax::first_argument(call))) {
                    return;
                }
                const std::string name(method);
                emit(call, name + "()",
                     "Use parameter binding: ->" + name + "('column = ?', [$value]) instead of concatenation.");
            }

            void check_native(const syntax::SyntaxNode& call) {
                const auto name = syntax::call_name(call);
                if (name != "mysqli_query" && name != "mysql_query" && name != "pg_query") {
                    return;
                }
                if (!is_vulnerable(native_sql_argument(call, name))) {
                    return;
                }
                emit(call, std::string(name) + "()",
                     "Avoid native PHP database functions. Use the DB facade or Eloquent with parameter binding.");
            }

            void emit(const syntax::SyntaxNode& call, const std::string& label, std::string recommendation) {
                context_.report(
                    SqlInjectionAnalyzer::ID, call, Severity::Critical,
                    "sql-injection",
                    "Potential SQL injection: " + label + " with string concatenation or user input",
                    std::move(recommendation),
                    {{"method", label}});
            }

            FileContext& context_;
        };

    }  // namespace

    bool reads_user_input(const syntax::SyntaxNode& expr) {
        std::vector<syntax::SyntaxNode> pending{expr};
        while (!pending.empty()) {
            const auto node = pending.back();
            pending.pop_back();

            if (node.is("variable_name") && vocab::contains(SUPERGLOBALS, node.text())) {
                return true;
            }
            if (syntax::is_function_call(node) && syntax::call_name(node) == "request") {
                return true;
            }
            if (syntax::is_member_call(node) && vocab::contains(REQUEST_READERS, syntax::call_name(node))) {
                const auto object = syntax::unwrap_parentheses(node.child_by_field("object"));
                if (object.is("variable_name") && object.text() == "$request") {
                    return true;
                }
            }
            if (syntax::is_static_call(node)) {
                const auto scope = string_utils::basename(node.child_by_field("scope").text());
                if (scope == "Request" || scope == "Input") {
                    return true;
                }
            }

            for (const auto& child : node.named_children()) {
                pending.push_back(child);
            }
        }
        return false;
    }

    std::unique_ptr<scope::FileVisitor> SqlInjectionAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<SqlInjectionVisitor>(context);
    }

    void register_sql_injection_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<SqlInjectionAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
