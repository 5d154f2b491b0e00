//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/scope/suppression.hpp"
#include "lpa/syntax/php_nodes.hpp"

#include <cctype>

namespace lpa::scope {

    namespace {
        bool is_rule_char(const char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        }

        bool is_blank(const char c) noexcept {
            return c == ' ' || c == '\t';
        }

        syntax::SyntaxNode next_non_comment_sibling(const syntax::SyntaxNode& node) {
            auto sibling = node.next_named_sibling();
            while (sibling.is("comment")) {
                sibling = sibling.next_named_sibling();
            }
            return sibling;
        }

        bool is_file_header(const syntax::SyntaxNode& comment) {
            if (!comment.parent().is("program")) {
                return false;
            }
            for (auto prev = comment.prev_named_sibling(); !prev.is_null(); prev = prev.prev_named_sibling()) {
                if (!prev.is("php_tag") && !prev.is("comment") && !prev.is("text")) {
                    return false;
                }
            }
            return true;
        }

        void collect_comments(const syntax::SyntaxNode& node, std::vector<syntax::SyntaxNode>& out) {
            for (const auto& child : node.named_children()) {
                if (child.is("comment")) {
                    out.push_back(child);
                } else {
                    collect_comments(child, out);
                }
            }
        }
    }

    // ============================================================================
    // RuleSet
    // ============================================================================

    bool RuleSet::covers(const std::string_view rule_id) const {
        return all || rules.contains(std::string(rule_id));
    }

    void RuleSet::merge(const RuleSet& other) {
        all = all || other.all;
        rules.insert(other.rules.begin(), other.rules.end());
    }

    std::optional<RuleSet> RuleSet::parse_marker(const std::string_view comment) {
        const auto pos = comment.find(SUPPRESSION_MARKER);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }

        std::string_view rest = comment.substr(pos + SUPPRESSION_MARKER.size());
        if (!rest.empty() && is_rule_char(rest.front())) {
            return std::nullopt;    // e.g. "@lpa-ignored"
        }

        RuleSet result;
        std::size_t i = 0;

        while (true) {
            while (i < rest.size() && is_blank(rest[i])) {
                ++i;
            }
            const std::size_t start = i;
            while (i < rest.size() && is_rule_char(rest[i])) {
                ++i;
            }
            if (i == start) {
                break;
            }
            result.rules.emplace(rest.substr(start, i - start));

            while (i < rest.size() && is_blank(rest[i])) {
                ++i;
            }
            if (i >= rest.size() || rest[i] != ',') {
                break;
            }
            ++i;
        }

        result.all = result.rules.empty();
        return result;
    }

    // ============================================================================
    // SuppressionIndex
    // ============================================================================

    SuppressionIndex SuppressionIndex::build(const syntax::SyntaxTree& tree) {
        SuppressionIndex index;

        std::vector<syntax::SyntaxNode> comments;
        collect_comments(tree.root(), comments);

        for (const auto& comment : comments) {
            if (auto rules = RuleSet::parse_marker(comment.text())) {
                index.add_comment(comment, *rules);
            }
        }

        return index;
    }

    void SuppressionIndex::add_comment(const syntax::SyntaxNode& comment, const RuleSet& rules) {
        if (const auto next = next_non_comment_sibling(comment); syntax::is_class_declaration(next)) {
            classes_[next.start_byte()].merge(rules);
            return;
        }

        if (is_file_header(comment)) {
            file_.merge(rules);
            return;
        }

        lines_[comment.end_line()].merge(rules);
        lines_[comment.end_line() + 1].merge(rules);
    }

    const RuleSet* SuppressionIndex::class_rules(const syntax::SyntaxNode& class_node) const {
        const auto it = classes_.find(class_node.start_byte());
        return it == classes_.end() ? nullptr : &it->second;
    }

    bool SuppressionIndex::line_suppressed(const std::string_view rule_id, const std::size_t line) const {
        const auto it = lines_.find(line);
        return it != lines_.end() && it->second.covers(rule_id);
    }

}  // namespace lpa::scope
