//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_SQL_INJECTION_ANALYZER_HPP
#define LPA_SQL_INJECTION_ANALYZER_HPP

/**
 * @file sql_injection_analyzer.hpp
 * @brief Raw SQL built from concatenation, interpolation or request input.
 *
 * Checked calls:
 * - DB::raw/select/selectOne/statement/insert/update/delete
 * - ->whereRaw/orWhereRaw/havingRaw/orHavingRaw/orderByRaw/selectRaw/groupByRaw/fromRaw
 * - mysqli_query/mysql_query/pg_query
 *
 * DB::unprepared() is reported whatever its argument is.
 */

#include "lpa/analyzers/analyzer.hpp"

namespace lpa::analyzers {

    class SqlInjectionAnalyzer : public IAnalyzer {
    public:
        static constexpr std::string_view ID = "sql-injection";

        [[nodiscard]] std::string_view id() const noexcept override {
            return ID;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "SQL Injection Analyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects raw SQL built from string concatenation, interpolation or user input";
        }

        [[nodiscard]] Category category() const noexcept override {
            return Category::Security;
        }

        [[nodiscard]] Severity severity() const noexcept override {
            return Severity::Critical;
        }

        [[nodiscard]] std::unique_ptr<scope::FileVisitor> create_visitor(FileContext& context) const override;
    };

    /**
     * Checks whether an expression reads request input anywhere inside it.
     *
     * Recognizes $request->input()-style calls, request(), the Request and
     * Input facades and the $_GET/$_POST/$_REQUEST/$_COOKIE superglobals.
     */
    [[nodiscard]] bool reads_user_input(const syntax::SyntaxNode& expr);

    void register_sql_injection_analyzer();

}  // namespace lpa::analyzers

#endif //LPA_SQL_INJECTION_ANALYZER_HPP
