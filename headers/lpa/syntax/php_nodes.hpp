//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef LPA_PHP_NODES_HPP
#define LPA_PHP_NODES_HPP

/**
 * @file php_nodes.hpp
 * @brief Helpers for reading PHP constructs out of the syntax tree.
 *
 * The tree-sitter PHP grammar spells the same construct slightly
 * differently across releases (e.g. anonymous_function vs
 * anonymous_function_creation_expression). Analyzers go through these
 * helpers instead of matching node kinds directly.
 */

#include "lpa/syntax/syntax_tree.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lpa::syntax {

    // ============================================================================
    // Node classification
    // ============================================================================

    [[nodiscard]] bool is_class_declaration(const SyntaxNode& node) noexcept;
    [[nodiscard]] bool is_anonymous_class(const SyntaxNode& node) noexcept;
    [[nodiscard]] bool is_method(const SyntaxNode& node) noexcept;
    [[nodiscard]] bool is_function(const SyntaxNode& node) noexcept;

    /// Closures and arrow functions.
    [[nodiscard]] bool is_closure(const SyntaxNode& node) noexcept;

    /// Instance calls, including the null-safe form.
    [[nodiscard]] bool is_member_call(const SyntaxNode& node) noexcept;
    [[nodiscard]] bool is_static_call(const SyntaxNode& node) noexcept;
    [[nodiscard]] bool is_function_call(const SyntaxNode& node) noexcept;
    [[nodiscard]] bool is_call(const SyntaxNode& node) noexcept;

    /// Property reads, including the null-safe form.
    [[nodiscard]] bool is_property_access(const SyntaxNode& node) noexcept;

    [[nodiscard]] bool is_loop(const SyntaxNode& node) noexcept;
    [[nodiscard]] bool is_string(const SyntaxNode& node) noexcept;

    // ============================================================================
    // Calls and arguments
    // ============================================================================

    /**
     * Returns the called name: the method for member/static calls and the
     * function name for plain function calls. Empty for other nodes.
     */
    [[nodiscard]] std::string_view call_name(const SyntaxNode& call) noexcept;

    /**
     * Returns the "arguments" node of a call or object creation.
     */
    [[nodiscard]] SyntaxNode call_arguments(const SyntaxNode& call) noexcept;

    /**
     * Returns the value expression of every argument of a call, in order.
     */
    [[nodiscard]] std::vector<SyntaxNode> argument_values(const SyntaxNode& call);

    /**
     * Returns the first argument value of a call, or a null node.
     */
    [[nodiscard]] SyntaxNode first_argument(const SyntaxNode& call);

    // ============================================================================
    // Literals
    // ============================================================================

    /**
     * Returns the value of a string literal without interpolation.
     *
     * 'users' and "users" yield "users"; "users_{$suffix}" yields nullopt,
     * as does every non-string node.
     */
    [[nodiscard]] std::optional<std::string> string_literal(const SyntaxNode& node);

    /**
     * Checks whether an expression produces a string at runtime from
     * non-literal parts: concatenation with a non-literal operand,
     * interpolation, or sprintf-style formatting.
     */
    [[nodiscard]] bool is_dynamic_string(const SyntaxNode& node);

    /**
     * Returns the operator token of a binary or unary expression.
     */
    [[nodiscard]] std::string_view operator_of(const SyntaxNode& node) noexcept;

    /**
     * Strips a single layer of parentheses.
     */
    [[nodiscard]] SyntaxNode unwrap_parentheses(SyntaxNode node) noexcept;

    // ============================================================================
    // Chains
    // ============================================================================

    enum class ChainRoot {
        None,
        StaticClass,    ///< Foo::method()
        Variable,       ///< $foo->method()
        Function,       ///< helper()->method()
        New,            ///< (new Foo)->method()
        Property,       ///< $foo->bar->method()
        Other
    };

    struct ChainLink {
        std::string_view name;
        SyntaxNode call;
    };

    /**
     * A fluent call chain such as User::with('posts')->where(...)->get().
     *
     * Links are ordered innermost first, so for the example above the
     * root is "User" and the links are with, where, get.
     */
    struct CallChain {
        ChainRoot root_kind = ChainRoot::None;
        std::string_view root;          ///< Class name as written, variable name (with $) or function name
        SyntaxNode root_node;
        std::vector<ChainLink> links;

        [[nodiscard]] bool contains(std::string_view name) const noexcept;
        [[nodiscard]] const ChainLink* find(std::string_view name) const noexcept;
        [[nodiscard]] std::string_view last() const noexcept;
    };

    /**
     * Splits a call expression into its root and the calls applied to it.
     */
    [[nodiscard]] CallChain decompose_chain(const SyntaxNode& expr);

    /**
     * A property chain rooted at a variable: $post->user->team.
     */
    struct PropertyChain {
        std::string_view variable;
        std::vector<std::string_view> segments;
    };

    /**
     * Decomposes a property access into a variable and property names.
     *
     * Returns nullopt when the chain is not rooted at a plain variable or
     * contains a dynamic property name.
     */
    [[nodiscard]] std::optional<PropertyChain> property_chain(const SyntaxNode& access);

    /**
     * Collects relationship paths passed to with()/load()-style calls.
     *
     * Accepts string literals, lists of string literals and the keys of
     * associative arrays (whose closure values are ignored). Column
     * selections ("user:id,name") are reduced to the relation path.
     */
    [[nodiscard]] std::vector<std::string> eager_load_paths(const SyntaxNode& call);

    /**
     * Returns the declared name of a class, method or function node.
     */
    [[nodiscard]] std::string_view declaration_name(const SyntaxNode& node) noexcept;

    /**
     * Returns the body node of a class, method, function or closure.
     */
    [[nodiscard]] SyntaxNode declaration_body(const SyntaxNode& node) noexcept;

    /**
     * Returns the written name of a class' parent (extends clause), or empty.
     */
    [[nodiscard]] std::string_view base_class_name(const SyntaxNode& class_node);

    /**
     * Returns the visibility keyword of a method ("public" when omitted).
     */
    [[nodiscard]] std::string_view method_visibility(const SyntaxNode& method);

    [[nodiscard]] bool is_static_method(const SyntaxNode& method) noexcept;

    /**
     * A property declared directly in a class body.
     */
    struct PropertyDefault {
        std::string_view name;      ///< Variable name with the leading $
        SyntaxNode element;
        SyntaxNode value;           ///< Initial value, null when there is none
    };

    /**
     * Returns the properties declared in a class body, in source order.
     */
    [[nodiscard]] std::vector<PropertyDefault> class_properties(const SyntaxNode& class_node);

    /**
     * Returns the string literal values of an array literal, skipping
     * every other element. For 'key' => 'value' entries the value counts.
     */
    [[nodiscard]] std::vector<std::pair<std::string, SyntaxNode>> array_string_values(const SyntaxNode& array);

}  // namespace lpa::syntax

#endif //LPA_PHP_NODES_HPP
