//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef LPA_NAME_RESOLVER_HPP
#define LPA_NAME_RESOLVER_HPP

#include "lpa/syntax/syntax_tree.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace lpa::syntax {

    /**
     * Resolves class names as written to fully-qualified names using the
     * current namespace and its `use` imports.
     *
     * Fully-qualified names are returned without the leading backslash.
     * The relative scopes self, static and parent are returned unchanged
     * for the caller to interpret.
     */
    class NameResolver {
    public:
        /**
         * Enters a namespace. Imports from the previous namespace are dropped.
         */
        void set_namespace(std::string_view name);

        [[nodiscard]] const std::string& current_namespace() const noexcept {
            return namespace_;
        }

        void add_import(std::string_view alias, std::string_view qualified_name);

        /**
         * Records the class imports of a namespace_use_declaration node.
         * Function and constant imports are ignored.
         */
        void collect_use_declaration(const SyntaxNode& declaration);

        [[nodiscard]] std::string resolve(std::string_view name) const;

        /**
         * Qualifies a declared (unqualified) class name with the current namespace.
         */
        [[nodiscard]] std::string qualify_declaration(std::string_view short_name) const;

        [[nodiscard]] static bool is_relative_scope(std::string_view name) noexcept;

    private:
        std::string namespace_;
        std::unordered_map<std::string, std::string> imports_;   // lowercase alias -> FQN
    };

}  // namespace lpa::syntax

#endif //LPA_NAME_RESOLVER_HPP
