//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_TRAVERSER_HPP
#define LPA_TRAVERSER_HPP

/**
 * @file traverser.hpp
 * @brief Single depth-first walk shared by every analyzer of a file.
 *
 * For each named node the traverser:
 * 1. pushes a scope frame if the node introduces one
 * 2. calls enter() on every visitor
 * 3. walks the children
 * 4. records variable provenance for assignments and load() statements
 * 5. calls leave() on every visitor
 * 6. pops the scope frame
 *
 * Visitors therefore see the scope of a class or method both when the
 * declaration node is entered and when it is left.
 */

#include "lpa/scope/provenance.hpp"
#include "lpa/scope/scope_tracker.hpp"
#include "lpa/syntax/syntax_tree.hpp"

#include <optional>
#include <vector>

namespace lpa::scope {

    /**
     * Per-file visitor interface implemented by analyzers.
     */
    class FileVisitor {
    public:
        virtual ~FileVisitor() = default;

        virtual void enter(const syntax::SyntaxNode& node) { (void)node; }
        virtual void leave(const syntax::SyntaxNode& node) { (void)node; }

        /**
         * Called once after the whole tree has been walked.
         */
        virtual void finish() {}
    };

    class Traverser {
    public:
        Traverser(ScopeTracker& scopes, std::vector<FileVisitor*> visitors);

        void run(const syntax::SyntaxTree& tree);

        /**
         * Returns the scope kind a node introduces, if any.
         */
        [[nodiscard]] static std::optional<ScopeKind> scope_kind_of(const syntax::SyntaxNode& node);

        /**
         * Checks whether a closure is passed as the first argument of a
         * transaction() call.
         */
        [[nodiscard]] static bool is_transaction_closure(const syntax::SyntaxNode& closure);

    private:
        void visit(const syntax::SyntaxNode& node);
        void register_local_classes(const syntax::SyntaxTree& tree);
        void record_assignment(const syntax::SyntaxNode& assignment);
        void record_lazy_eager_load(const syntax::SyntaxNode& statement);
        void record_foreach_binding(const syntax::SyntaxNode& loop);

        ScopeTracker& scopes_;
        ProvenanceResolver resolver_;
        std::vector<FileVisitor*> visitors_;
    };

    /**
     * Returns the iterated expression and the value variable of a foreach.
     */
    struct ForeachParts {
        syntax::SyntaxNode source;
        syntax::SyntaxNode value;       ///< variable_name, or null for list() destructuring
        syntax::SyntaxNode body;
    };

    [[nodiscard]] ForeachParts foreach_parts(const syntax::SyntaxNode& loop);

}  // namespace lpa::scope

#endif //LPA_TRAVERSER_HPP
