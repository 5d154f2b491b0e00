//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_SUPPRESSION_HPP
#define LPA_SUPPRESSION_HPP

/**
 * @file suppression.hpp
 * @brief Suppression markers in comments.
 *
 * A comment containing `@lpa-ignore` suppresses every rule; listing rule
 * ids after the marker (`@lpa-ignore sql-injection, fat-model`) limits it
 * to those rules. Where the comment sits decides the scope:
 * - immediately before a class declaration: the whole class
 * - at the top of the file, before any declaration: the whole file
 * - anywhere else: the comment's last line and the line after it
 */

#include "lpa/syntax/syntax_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lpa::scope {

    inline constexpr std::string_view SUPPRESSION_MARKER = "@lpa-ignore";

    /**
     * A set of suppressed rules, or all rules.
     */
    struct RuleSet {
        bool all = false;
        std::set<std::string> rules;

        [[nodiscard]] bool covers(std::string_view rule_id) const;
        [[nodiscard]] bool empty() const noexcept { return !all && rules.empty(); }

        void merge(const RuleSet& other);

        /**
         * Parses the marker out of a comment.
         *
         * @return The suppressed rules, or nullopt if the comment has no marker.
         */
        [[nodiscard]] static std::optional<RuleSet> parse_marker(std::string_view comment);
    };

    /**
     * Suppressions of one file, computed before analysis.
     */
    class SuppressionIndex {
    public:
        [[nodiscard]] static SuppressionIndex build(const syntax::SyntaxTree& tree);

        [[nodiscard]] const RuleSet& file_rules() const noexcept { return file_; }

        /**
         * Returns the rules suppressed for a class declaration node, or null.
         */
        [[nodiscard]] const RuleSet* class_rules(const syntax::SyntaxNode& class_node) const;

        [[nodiscard]] bool line_suppressed(std::string_view rule_id, std::size_t line) const;

    private:
        void add_comment(const syntax::SyntaxNode& comment, const RuleSet& rules);

        RuleSet file_;
        std::unordered_map<std::uint32_t, RuleSet> classes_;   // class start byte -> rules
        std::map<std::size_t, RuleSet> lines_;
    };

}  // namespace lpa::scope

#endif //LPA_SUPPRESSION_HPP
