//
// Created by gregorian-rayne on 1/13/26.
//

#include "lpa/syntax/name_resolver.hpp"
#include "lpa/utils/string_utils.hpp"

namespace lpa::syntax {

    namespace {
        std::string_view strip_leading_backslash(std::string_view name) noexcept {
            if (!name.empty() && name.front() == '\\') {
                name.remove_prefix(1);
            }
            return name;
        }

        bool is_name_node(const SyntaxNode& node) noexcept {
            const auto kind = node.kind();
            return kind == "name" || kind == "qualified_name" || kind == "namespace_name";
        }

        bool imports_non_class_symbols(const SyntaxNode& declaration) {
            const std::size_t count = declaration.child_count();
            for (std::size_t i = 0; i < count; ++i) {
                const auto child = declaration.child(i);
                if (child.text() == "function" || child.text() == "const") {
                    return true;
                }
            }
            return false;
        }
    }

    void NameResolver::set_namespace(const std::string_view name) {
        namespace_ = std::string(strip_leading_backslash(name));
        imports_.clear();
    }

    void NameResolver::add_import(const std::string_view alias, const std::string_view qualified_name) {
        imports_[string_utils::to_lower(alias)] = std::string(strip_leading_backslash(qualified_name));
    }

    void NameResolver::collect_use_declaration(const SyntaxNode& declaration) {
        if (imports_non_class_symbols(declaration)) {
            return;
        }

        std::string prefix;
        std::vector<SyntaxNode> clauses;

        for (const auto& child : declaration.named_children()) {
            if (child.is("namespace_use_clause")) {
                clauses.push_back(child);
            } else if (is_name_node(child)) {
                prefix = std::string(strip_leading_backslash(child.text()));
            } else if (child.is("namespace_use_group")) {
                for (const auto& grouped : child.named_children()) {
                    if (grouped.is("namespace_use_group_clause") || grouped.is("namespace_use_clause")) {
                        clauses.push_back(grouped);
                    }
                }
            }
        }

        for (const auto& clause : clauses) {
            std::string_view target;
            std::string_view alias;

            if (auto alias_node = clause.child_by_field("alias")) {
                alias = alias_node.text();
            }

            for (const auto& part : clause.named_children()) {
                if (is_name_node(part)) {
                    if (target.empty()) {
                        target = part.text();
                    } else if (alias.empty()) {
                        alias = part.text();
                    }
                } else if (part.is("namespace_aliasing_clause") && alias.empty()) {
                    alias = part.named_child(0).text();
                }
            }

            if (target.empty()) {
                continue;
            }

            std::string qualified = prefix.empty()
                ? std::string(strip_leading_backslash(target))
                : prefix + "\\" + std::string(strip_leading_backslash(target));

            if (alias.empty()) {
                alias = string_utils::basename(qualified);
            }
            add_import(alias, qualified);
        }
    }

    std::string NameResolver::resolve(const std::string_view name) const {
        if (name.empty()) {
            return {};
        }
        if (name.front() == '\\') {
            return std::string(name.substr(1));
        }
        if (is_relative_scope(name)) {
            return string_utils::to_lower(name);
        }

        const auto separator = name.find('\\');
        const auto first = name.substr(0, separator);

        if (const auto it = imports_.find(string_utils::to_lower(first)); it != imports_.end()) {
            if (separator == std::string_view::npos) {
                return it->second;
            }
            return it->second + std::string(name.substr(separator));
        }

        return qualify_declaration(name);
    }

    std::string NameResolver::qualify_declaration(const std::string_view short_name) const {
        if (namespace_.empty()) {
            return std::string(short_name);
        }
        return namespace_ + "\\" + std::string(short_name);
    }

    bool NameResolver::is_relative_scope(const std::string_view name) noexcept {
        return string_utils::iequals(name, "self") ||
               string_utils::iequals(name, "static") ||
               string_utils::iequals(name, "parent");
    }

}  // namespace lpa::syntax
