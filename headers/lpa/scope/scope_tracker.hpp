//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_SCOPE_TRACKER_HPP
#define LPA_SCOPE_TRACKER_HPP

/**
 * @file scope_tracker.hpp
 * @brief Lexical scope stack maintained during a file traversal.
 *
 * The tracker holds one frame per enclosing file, namespace block,
 * class, method, function and closure. Frames are owned by the stack and
 * refer to their parent through a non-owning pointer.
 *
 * Variable bindings live in the innermost method, function or closure
 * frame (the file frame for top-level code). A new frame starts with no
 * bindings, so nothing leaks between methods and closures do not see the
 * variables of the code that defines them.
 */

#include "lpa/scope/provenance.hpp"
#include "lpa/scope/suppression.hpp"
#include "lpa/syntax/name_resolver.hpp"
#include "lpa/syntax/syntax_tree.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lpa::models {
    class ModelRegistry;
}

namespace lpa::scope {

    enum class ScopeKind {
        File,
        Namespace,
        Class,
        AnonymousClass,
        Method,
        Function,
        Closure
    };

    const char* to_string(ScopeKind kind) noexcept;

    struct Scope {
        ScopeKind kind = ScopeKind::File;
        std::string name;               ///< Declared name; empty for files, closures and anonymous classes
        std::string qualified_name;     ///< Classes only
        std::string parent_class;       ///< Classes only: resolved `extends` target
        const Scope* parent = nullptr;
        syntax::SyntaxNode node;
        RuleSet suppressed;
        bool transaction_protected = false;
        std::unordered_map<std::string, Provenance> bindings;

        [[nodiscard]] bool is_class() const noexcept {
            return kind == ScopeKind::Class || kind == ScopeKind::AnonymousClass;
        }

        [[nodiscard]] bool is_callable() const noexcept {
            return kind == ScopeKind::Method || kind == ScopeKind::Function || kind == ScopeKind::Closure;
        }
    };

    class ScopeTracker {
    public:
        ScopeTracker(const models::ModelRegistry& registry, const SuppressionIndex& suppressions);

        ScopeTracker(const ScopeTracker&) = delete;
        ScopeTracker& operator=(const ScopeTracker&) = delete;

        /**
         * Registers a class declared in the file being analyzed so that
         * base-class chains can be resolved before the registry is consulted.
         */
        void add_local_class(std::string qualified_name, std::string parent);

        /**
         * Pushes a frame for a scope-introducing node.
         */
        void enter_scope(ScopeKind kind, const syntax::SyntaxNode& node, bool transaction_protected = false);

        /**
         * Pops the innermost frame. The file frame is never popped.
         */
        void leave_scope();

        [[nodiscard]] std::size_t depth() const noexcept { return stack_.size(); }
        [[nodiscard]] const Scope& current() const noexcept { return *stack_.back(); }

        /// Innermost class frame, named or anonymous.
        [[nodiscard]] const Scope* current_class() const noexcept;

        /// Innermost method, function or closure frame.
        [[nodiscard]] const Scope* current_callable() const noexcept;

        /// Innermost method or named function frame, looking through closures.
        [[nodiscard]] const Scope* current_method() const noexcept;

        /**
         * Returns the ancestors of the innermost class, nearest first.
         *
         * Resolution walks classes of this file, then the model registry.
         * It stops at an ORM base class, at a class it cannot resolve
         * (which is still included) or on a cycle. Empty outside a class.
         */
        [[nodiscard]] std::vector<std::string> current_class_chain() const;

        /**
         * Checks whether the innermost class descends from an ORM base model.
         */
        [[nodiscard]] bool in_model_class() const;

        void bind(std::string_view variable, Provenance provenance);

        /**
         * Looks a variable up in the innermost binding frame only.
         */
        [[nodiscard]] Provenance lookup(std::string_view variable) const;

        /**
         * True when any enclosing frame runs inside a transaction closure.
         */
        [[nodiscard]] bool in_transaction() const noexcept;

        /**
         * True when any enclosing frame suppresses the rule.
         */
        [[nodiscard]] bool is_suppressed(std::string_view rule_id) const;

        /**
         * Resolves a class name as written, including self, static and parent.
         */
        [[nodiscard]] std::string resolve_class(std::string_view written) const;

        [[nodiscard]] syntax::NameResolver& names() noexcept { return names_; }
        [[nodiscard]] const syntax::NameResolver& names() const noexcept { return names_; }

        [[nodiscard]] const models::ModelRegistry& registry() const noexcept { return registry_; }

    private:
        Scope& binding_frame() noexcept;
        [[nodiscard]] const Scope& binding_frame() const noexcept;

        const models::ModelRegistry& registry_;
        const SuppressionIndex& suppressions_;
        syntax::NameResolver names_;
        std::unordered_map<std::string, std::string> local_parents_;
        std::vector<std::unique_ptr<Scope>> stack_;
    };

    /**
     * Keeps enter/leave balanced regardless of how the visiting code exits.
     */
    class ScopeGuard {
    public:
        ScopeGuard(ScopeTracker& tracker, const ScopeKind kind, const syntax::SyntaxNode& node,
                   const bool transaction_protected = false)
            : tracker_(tracker) {
            tracker_.enter_scope(kind, node, transaction_protected);
        }

        ~ScopeGuard() {
            tracker_.leave_scope();
        }

        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        ScopeTracker& tracker_;
    };

}  // namespace lpa::scope

#endif //LPA_SCOPE_TRACKER_HPP
