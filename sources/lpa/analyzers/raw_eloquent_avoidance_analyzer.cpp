//
// Created by gregorian-rayne on 1/16/26.
//

#include "lpa/analyzers/raw_eloquent_avoidance_analyzer.hpp"

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <cctype>
#include <regex>
#include <string>

namespace lpa::analyzers
{
    namespace {

        std::string normalized(const std::string_view sql) {
            return string_utils::to_lower(string_utils::trim(sql));
        }

        std::string aggregate_alternative(const std::string& sql) {
            if (string_utils::contains(sql, "count")) return "Model::count() or Model::where(...)->count()";
            if (string_utils::contains(sql, "sum")) return "Model::sum('column')";
            if (string_utils::contains(sql, "avg")) return "Model::avg('column')";
            if (string_utils::contains(sql, "max")) return "Model::max('column')";
            if (string_utils::contains(sql, "min")) return "Model::min('column')";
            return "Use Eloquent query builder methods";
        }

        std::string modification_alternative(const std::string_view method) {
            if (method == "insert") return "Model::create([...]) or Model::insert([...])";
            if (method == "update") return "Model::where(...)->update([...]) or $model->update([...])";
            return "Model::where(...)->delete() or $model->delete()";
        }

        std::string upper(std::string_view text) {
            std::string result(text);
            for (auto& c : result) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return result;
        }

        class RawEloquentVisitor final : public scope::FileVisitor {
        public:
            explicit RawEloquentVisitor(FileContext& context)
                : context_(context) {}

            void enter(const syntax::SyntaxNode& node) override {
                if (!syntax::is_static_call(node) || !scope::is_db_facade(node.child_by_field("scope").text())) {
                    return;
                }
                const auto sql = syntax::string_literal(syntax::first_argument(node));
                if (!sql) {
                    return;
                }

                const auto method = syntax::call_name(node);
                const std::string lowered = normalized(*sql);
                if (method == "raw" && is_simple_aggregate(lowered)) {
                    context_.report(
                        RawEloquentAvoidanceAnalyzer::ID, node, Severity::Low,
                        "raw-aggregate",
                        "Using DB::raw() for simple query that could use Eloquent methods",
                        "Consider using Eloquent methods instead of raw SQL. Example: " + aggregate_alternative(lowered),
                        {{"method", "raw"}, {"sql", *sql}});
                } else if (method == "select" && is_simple_select(lowered)) {
                    context_.report(
                        RawEloquentAvoidanceAnalyzer::ID, node, Severity::Low,
                        "raw-select",
                        "Simple SELECT query using DB::select() could use Eloquent",
                        "Use Eloquent query builder for better readability and security. "
                        "Example: Model::where(...)->get()",
                        {{"method", "select"}, {"sql", *sql}});
                } else if ((method == "insert" || method == "update" || method == "delete") &&
                           is_simple_modification(lowered)) {
                    context_.report(
                        RawEloquentAvoidanceAnalyzer::ID, node, Severity::Low,
                        "raw-modification",
                        "Simple " + upper(method) + " query could use Eloquent",
                        "Use Eloquent methods: " + modification_alternative(method),
                        {{"method", std::string(method)}, {"sql", *sql}});
                }
            }

        private:
            FileContext& context_;
        };

    }  // namespace

    bool is_simple_aggregate(const std::string_view sql) {
        static const std::regex aggregate_regex(R"((count\s*\(\s*\*\s*\))|((sum|avg|max|min)\s*\(\s*\w+\s*\)))",
                                                std::regex::icase);
        const std::string text = normalized(sql);
        return std::regex_match(text, aggregate_regex);
    }

    bool is_simple_select(const std::string_view sql) {
        static const std::regex star_where_regex(R"(select\s+\*\s+from\s+\w+\s+where\s+\w+\s*=\s*\??\s*)",
                                                 std::regex::icase);
        static const std::regex star_regex(R"(select\s+\*\s+from\s+\w+\s*)", std::regex::icase);
        static const std::regex columns_regex(R"(select\s+[\w,\s]+\s+from\s+\w+\s*)", std::regex::icase);

        const std::string text = normalized(sql);
        return std::regex_match(text, star_where_regex) ||
               std::regex_match(text, star_regex) ||
               std::regex_match(text, columns_regex);
    }

    bool is_simple_modification(const std::string_view sql) {
        static const std::regex insert_regex(R"(insert\s+into\s+\w+\s*\()", std::regex::icase);
        static const std::regex update_regex(R"(update\s+\w+\s+set\s+\w+\s*=)", std::regex::icase);
        static const std::regex delete_regex(R"(delete\s+from\s+\w+\s+where\s+\w+\s*=)", std::regex::icase);

        const std::string text = normalized(sql);
        if (string_utils::contains(text, "join") || string_utils::contains(text, "select")) {
            return false;
        }
        const auto flags = std::regex_constants::match_continuous;
        return std::regex_search(text, insert_regex, flags) ||
               std::regex_search(text, update_regex, flags) ||
               std::regex_search(text, delete_regex, flags);
    }

    std::unique_ptr<scope::FileVisitor> RawEloquentAvoidanceAnalyzer::create_visitor(FileContext& context) const {
        return std::make_unique<RawEloquentVisitor>(context);
    }

    void register_raw_eloquent_avoidance_analyzer() {
        AnalyzerRegistry::instance().register_analyzer([] {
            return std::make_unique<RawEloquentAvoidanceAnalyzer>();
        });
    }

}  // namespace lpa::analyzers
