//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef LPA_SYNTAX_TREE_HPP
#define LPA_SYNTAX_TREE_HPP

/**
 * @file syntax_tree.hpp
 * @brief Read-only view over a tree-sitter PHP syntax tree.
 *
 * SyntaxTree owns the parsed tree and the source text it was parsed
 * from. SyntaxNode is a cheap value handle into that tree and stays
 * valid as long as the owning SyntaxTree is alive (moving the tree
 * keeps nodes valid).
 *
 * Parsing is stateless from the caller's point of view: each call to
 * parse() uses its own parser instance, so trees may be built
 * concurrently from different threads.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"

extern "C" {
#include <tree_sitter/api.h>
}

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lpa::syntax {

    /**
     * A node of a parsed syntax tree.
     *
     * A default-constructed node is null. Every accessor is safe to call
     * on a null node and returns an empty value.
     */
    class SyntaxNode {
    public:
        SyntaxNode() noexcept;
        SyntaxNode(TSNode node, const std::string* source) noexcept;

        [[nodiscard]] bool is_null() const noexcept;
        explicit operator bool() const noexcept { return !is_null(); }

        /// Grammar node kind, e.g. "member_call_expression".
        [[nodiscard]] std::string_view kind() const noexcept;
        [[nodiscard]] bool is(std::string_view kind) const noexcept { return this->kind() == kind; }

        /// Source text covered by this node.
        [[nodiscard]] std::string_view text() const noexcept;

        /// 1-based line numbers.
        [[nodiscard]] std::size_t start_line() const noexcept;
        [[nodiscard]] std::size_t end_line() const noexcept;

        [[nodiscard]] std::uint32_t start_byte() const noexcept;
        [[nodiscard]] std::uint32_t end_byte() const noexcept;

        [[nodiscard]] bool is_named() const noexcept;
        [[nodiscard]] bool has_error() const noexcept;

        [[nodiscard]] SyntaxNode child_by_field(std::string_view field) const noexcept;

        [[nodiscard]] std::size_t child_count() const noexcept;
        [[nodiscard]] SyntaxNode child(std::size_t index) const noexcept;

        [[nodiscard]] std::size_t named_child_count() const noexcept;
        [[nodiscard]] SyntaxNode named_child(std::size_t index) const noexcept;
        [[nodiscard]] std::vector<SyntaxNode> named_children() const;

        [[nodiscard]] SyntaxNode parent() const noexcept;
        [[nodiscard]] SyntaxNode next_named_sibling() const noexcept;
        [[nodiscard]] SyntaxNode prev_named_sibling() const noexcept;

        /**
         * Returns true if this node's byte range lies within other's.
         */
        [[nodiscard]] bool is_within(const SyntaxNode& other) const noexcept;

        bool operator==(const SyntaxNode& other) const noexcept;
        bool operator!=(const SyntaxNode& other) const noexcept { return !(*this == other); }

    private:
        TSNode node_;
        const std::string* source_ = nullptr;
    };

    /**
     * A parsed PHP source file.
     */
    class SyntaxTree {
    public:
        /**
         * Parses PHP source text.
         *
         * @param source Complete file contents, including the opening tag.
         * @return The tree, or a ParseError if the source contains syntax errors.
         */
        [[nodiscard]] static Result<SyntaxTree, Error> parse(std::string source);

        [[nodiscard]] SyntaxNode root() const noexcept;
        [[nodiscard]] const std::string& source() const noexcept { return *source_; }

        /**
         * Returns the 1-based line containing a byte offset.
         */
        [[nodiscard]] std::size_t line_of(std::uint32_t byte) const noexcept;

    private:
        struct TreeDeleter {
            void operator()(TSTree* tree) const noexcept;
        };

        SyntaxTree(std::unique_ptr<const std::string> source, TSTree* tree);

        std::unique_ptr<const std::string> source_;
        std::unique_ptr<TSTree, TreeDeleter> tree_;
    };

}  // namespace lpa::syntax

#endif //LPA_SYNTAX_TREE_HPP
