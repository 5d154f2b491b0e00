//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef LPA_TESTS_PHP_FIXTURE_HPP
#define LPA_TESTS_PHP_FIXTURE_HPP

#include "lpa/syntax/syntax_tree.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

namespace lpa::testing {

    /**
     * Parses a PHP snippet, failing the current test on a syntax error.
     */
    inline syntax::SyntaxTree parse_php(std::string source) {
        auto tree = syntax::SyntaxTree::parse(std::move(source));
        if (tree.is_err()) {
            ADD_FAILURE() << tree.error().to_string();
            return syntax::SyntaxTree::parse("<?php\n").value();
        }
        return std::move(tree).value();
    }

    /**
     * Collects nodes matching a predicate in document order.
     */
    inline std::vector<syntax::SyntaxNode> find_all(const syntax::SyntaxNode& root,
                                                    const std::function<bool(const syntax::SyntaxNode&)>& pred) {
        std::vector<syntax::SyntaxNode> found;
        std::vector<syntax::SyntaxNode> pending{root};
        while (!pending.empty()) {
            const auto node = pending.back();
            pending.pop_back();
            if (pred(node)) {
                found.push_back(node);
            }
            const auto children = node.named_children();
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending.push_back(*it);
            }
        }
        return found;
    }

    inline syntax::SyntaxNode find_first(const syntax::SyntaxNode& root, const std::string_view kind) {
        const auto found = find_all(root, [kind](const syntax::SyntaxNode& n) { return n.is(kind); });
        return found.empty() ? syntax::SyntaxNode{} : found.front();
    }

}  // namespace lpa::testing

#endif //LPA_TESTS_PHP_FIXTURE_HPP
