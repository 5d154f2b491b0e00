//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_QUERY_PATTERNS_HPP
#define LPA_QUERY_PATTERNS_HPP

/**
 * @file query_patterns.hpp
 * @brief Recognizes database queries in call chains.
 *
 * Shared by the analyzers that care whether a call talks to the
 * database: inside loops, inside route closures and when counting writes.
 */

#include "lpa/syntax/php_nodes.hpp"
#include "lpa/syntax/syntax_tree.hpp"

#include <string_view>

namespace lpa::analyzers {

    class FileContext;

    /**
     * Checks whether a method name executes a builder query.
     */
    [[nodiscard]] bool is_query_terminal(std::string_view method) noexcept;

    /**
     * Checks whether a call is the last call of its chain.
     *
     * For User::where(...)->get() only the get() call is outermost.
     */
    [[nodiscard]] bool is_outermost_call(const syntax::SyntaxNode& call) noexcept;

    /**
     * Checks whether the chain is rooted at a model class.
     */
    [[nodiscard]] bool is_model_rooted(const FileContext& context, const syntax::CallChain& chain);

    /**
     * Checks whether the chain is rooted at the DB facade.
     */
    [[nodiscard]] bool is_db_rooted(const syntax::CallChain& chain) noexcept;

    /**
     * Checks whether an outermost call executes a database query.
     *
     * Recognized:
     * - Model::...->terminal() and Model::terminal()
     * - DB::table(...)->...->terminal(), DB::select/insert/update/delete/statement(...)
     * - $builder->...->terminal() for variables holding a builder
     * - $model->relation()->...->terminal() for variables holding a model
     */
    [[nodiscard]] bool is_query_call(const FileContext& context, const syntax::SyntaxNode& call);

}  // namespace lpa::analyzers

#endif //LPA_QUERY_PATTERNS_HPP
