//
// Created by gregorian-rayne on 1/13/26.
//

#include "lpa/syntax/syntax_tree.hpp"

#include <algorithm>
#include <string_view>

extern "C" const TSLanguage* tree_sitter_php();

namespace lpa::syntax {

    namespace {
        struct ParserDeleter {
            void operator()(TSParser* parser) const noexcept {
                ts_parser_delete(parser);
            }
        };

        /**
         * Finds the first ERROR or MISSING node for diagnostics.
         */
        TSNode find_error(const TSNode node) {
            if (std::string_view(ts_node_type(node)) == "ERROR" || ts_node_is_missing(node)) {
                return node;
            }
            const std::uint32_t count = ts_node_child_count(node);
            for (std::uint32_t i = 0; i < count; ++i) {
                const TSNode child = ts_node_child(node, i);
                if (ts_node_has_error(child)) {
                    return find_error(child);
                }
            }
            return node;
        }
    }

    // ============================================================================
    // SyntaxNode
    // ============================================================================

    SyntaxNode::SyntaxNode() noexcept
        : node_{} {}

    SyntaxNode::SyntaxNode(const TSNode node, const std::string* source) noexcept
        : node_(node), source_(source) {}

    bool SyntaxNode::is_null() const noexcept {
        return source_ == nullptr || ts_node_is_null(node_);
    }

    std::string_view SyntaxNode::kind() const noexcept {
        if (is_null()) {
            return {};
        }
        return ts_node_type(node_);
    }

    std::string_view SyntaxNode::text() const noexcept {
        if (is_null()) {
            return {};
        }
        const auto start = std::min<std::size_t>(ts_node_start_byte(node_), source_->size());
        const auto end = std::min<std::size_t>(ts_node_end_byte(node_), source_->size());
        return std::string_view(*source_).substr(start, end - start);
    }

    std::size_t SyntaxNode::start_line() const noexcept {
        return is_null() ? 0 : ts_node_start_point(node_).row + 1;
    }

    std::size_t SyntaxNode::end_line() const noexcept {
        if (is_null()) {
            return 0;
        }
        // A node whose text ends with a newline ends on the previous line
        const TSPoint end = ts_node_end_point(node_);
        if (end.column == 0 && end.row > ts_node_start_point(node_).row) {
            return end.row;
        }
        return end.row + 1;
    }

    std::uint32_t SyntaxNode::start_byte() const noexcept {
        return is_null() ? 0 : ts_node_start_byte(node_);
    }

    std::uint32_t SyntaxNode::end_byte() const noexcept {
        return is_null() ? 0 : ts_node_end_byte(node_);
    }

    bool SyntaxNode::is_named() const noexcept {
        return !is_null() && ts_node_is_named(node_);
    }

    bool SyntaxNode::has_error() const noexcept {
        return !is_null() && ts_node_has_error(node_);
    }

    SyntaxNode SyntaxNode::child_by_field(const std::string_view field) const noexcept {
        if (is_null()) {
            return {};
        }
        return {ts_node_child_by_field_name(node_, field.data(), static_cast<std::uint32_t>(field.size())), source_};
    }

    std::size_t SyntaxNode::child_count() const noexcept {
        return is_null() ? 0 : ts_node_child_count(node_);
    }

    SyntaxNode SyntaxNode::child(const std::size_t index) const noexcept {
        if (index >= child_count()) {
            return {};
        }
        return {ts_node_child(node_, static_cast<std::uint32_t>(index)), source_};
    }

    std::size_t SyntaxNode::named_child_count() const noexcept {
        return is_null() ? 0 : ts_node_named_child_count(node_);
    }

    SyntaxNode SyntaxNode::named_child(const std::size_t index) const noexcept {
        if (index >= named_child_count()) {
            return {};
        }
        return {ts_node_named_child(node_, static_cast<std::uint32_t>(index)), source_};
    }

    std::vector<SyntaxNode> SyntaxNode::named_children() const {
        std::vector<SyntaxNode> result;
        const std::size_t count = named_child_count();
        result.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            result.emplace_back(ts_node_named_child(node_, static_cast<std::uint32_t>(i)), source_);
        }
        return result;
    }

    SyntaxNode SyntaxNode::parent() const noexcept {
        if (is_null()) {
            return {};
        }
        return {ts_node_parent(node_), source_};
    }

    SyntaxNode SyntaxNode::next_named_sibling() const noexcept {
        if (is_null()) {
            return {};
        }
        return {ts_node_next_named_sibling(node_), source_};
    }

    SyntaxNode SyntaxNode::prev_named_sibling() const noexcept {
        if (is_null()) {
            return {};
        }
        return {ts_node_prev_named_sibling(node_), source_};
    }

    bool SyntaxNode::is_within(const SyntaxNode& other) const noexcept {
        if (is_null() || other.is_null()) {
            return false;
        }
        return start_byte() >= other.start_byte() && end_byte() <= other.end_byte();
    }

    bool SyntaxNode::operator==(const SyntaxNode& other) const noexcept {
        if (is_null() || other.is_null()) {
            return is_null() == other.is_null();
        }
        return ts_node_eq(node_, other.node_);
    }

    // ============================================================================
    // SyntaxTree
    // ============================================================================

    void SyntaxTree::TreeDeleter::operator()(TSTree* tree) const noexcept {
        ts_tree_delete(tree);
    }

    SyntaxTree::SyntaxTree(std::unique_ptr<const std::string> source, TSTree* tree)
        : source_(std::move(source)), tree_(tree) {}

    Result<SyntaxTree, Error> SyntaxTree::parse(std::string source) {
        const std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
        if (!parser) {
            return Result<SyntaxTree, Error>::failure(
                Error::internal_error("Failed to create tree-sitter parser")
            );
        }

        if (!ts_parser_set_language(parser.get(), tree_sitter_php())) {
            return Result<SyntaxTree, Error>::failure(
                Error::internal_error("Incompatible tree-sitter PHP grammar version")
            );
        }

        auto text = std::make_unique<const std::string>(std::move(source));
        TSTree* tree = ts_parser_parse_string(
            parser.get(), nullptr, text->data(), static_cast<std::uint32_t>(text->size()));
        if (tree == nullptr) {
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error("Parser returned no tree")
            );
        }

        SyntaxTree result(std::move(text), tree);
        const TSNode root = ts_tree_root_node(tree);
        if (ts_node_has_error(root)) {
            const TSNode error = find_error(root);
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error("Syntax error",
                                   "line " + std::to_string(ts_node_start_point(error).row + 1))
            );
        }

        return Result<SyntaxTree, Error>::success(std::move(result));
    }

    SyntaxNode SyntaxTree::root() const noexcept {
        return {ts_tree_root_node(tree_.get()), source_.get()};
    }

    std::size_t SyntaxTree::line_of(const std::uint32_t byte) const noexcept {
        const auto end = std::min<std::size_t>(byte, source_->size());
        return static_cast<std::size_t>(std::count(source_->begin(), source_->begin() + static_cast<std::ptrdiff_t>(end), '\n')) + 1;
    }

}  // namespace lpa::syntax
