//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/scope/traverser.hpp"
#include "lpa/scope/vocabulary.hpp"
#include "lpa/models/model_registry.hpp"
#include "lpa/syntax/php_nodes.hpp"

namespace lpa::scope {

    ForeachParts foreach_parts(const syntax::SyntaxNode& loop) {
        ForeachParts parts;
        if (!loop.is("foreach_statement")) {
            return parts;
        }

        parts.source = loop.named_child(0);

        auto value = loop.named_child(1);
        if (value.is("pair")) {
            value = value.named_child(value.named_child_count() - 1);
        }
        if (value.is("by_ref")) {
            value = value.named_child(0);
        }
        if (value.is("variable_name")) {
            parts.value = value;
        }

        if (auto body = loop.child_by_field("body")) {
            parts.body = body;
        } else if (loop.named_child_count() > 2) {
            parts.body = loop.named_child(loop.named_child_count() - 1);
        }
        return parts;
    }

    Traverser::Traverser(ScopeTracker& scopes, std::vector<FileVisitor*> visitors)
        : scopes_(scopes), resolver_(scopes), visitors_(std::move(visitors)) {}

    void Traverser::run(const syntax::SyntaxTree& tree) {
        register_local_classes(tree);
        visit(tree.root());
        for (auto* visitor : visitors_) {
            visitor->finish();
        }
    }

    std::optional<ScopeKind> Traverser::scope_kind_of(const syntax::SyntaxNode& node) {
        if (node.is("namespace_definition")) {
            if (node.child_by_field("body")) {
                return ScopeKind::Namespace;
            }
            return std::nullopt;
        }
        if (syntax::is_class_declaration(node) || node.is("trait_declaration")) {
            return ScopeKind::Class;
        }
        if (syntax::is_anonymous_class(node)) {
            return ScopeKind::AnonymousClass;
        }
        if (syntax::is_method(node)) {
            return ScopeKind::Method;
        }
        if (syntax::is_function(node)) {
            return ScopeKind::Function;
        }
        if (syntax::is_closure(node)) {
            return ScopeKind::Closure;
        }
        return std::nullopt;
    }

    bool Traverser::is_transaction_closure(const syntax::SyntaxNode& closure) {
        const auto argument = closure.parent();
        if (!argument.is("argument")) {
            return false;
        }
        const auto arguments = argument.parent();
        if (!arguments.is("arguments") || arguments.named_child(0) != argument) {
            return false;
        }
        return syntax::call_name(arguments.parent()) == "transaction";
    }

    void Traverser::register_local_classes(const syntax::SyntaxTree& tree) {
        for (auto& record : models::collect_class_records(tree, {})) {
            scopes_.add_local_class(std::move(record.name), std::move(record.parent));
        }
    }

    void Traverser::visit(const syntax::SyntaxNode& node) {
        if (node.is("namespace_definition") && !node.child_by_field("body")) {
            scopes_.names().set_namespace(node.child_by_field("name").text());
        } else if (node.is("namespace_use_declaration")) {
            scopes_.names().collect_use_declaration(node);
        }

        std::optional<ScopeGuard> guard;
        if (const auto kind = scope_kind_of(node)) {
            const bool protected_closure = *kind == ScopeKind::Closure && is_transaction_closure(node);
            guard.emplace(scopes_, *kind, node, protected_closure);
        }

        for (auto* visitor : visitors_) {
            visitor->enter(node);
        }

        if (node.is("foreach_statement")) {
            record_foreach_binding(node);
        }

        const std::size_t count = node.named_child_count();
        for (std::size_t i = 0; i < count; ++i) {
            visit(node.named_child(i));
        }

        if (node.is("assignment_expression")) {
            record_assignment(node);
        } else if (node.is("expression_statement")) {
            record_lazy_eager_load(node);
        }

        for (auto* visitor : visitors_) {
            visitor->leave(node);
        }
    }

    void Traverser::record_assignment(const syntax::SyntaxNode& assignment) {
        const auto left = assignment.child_by_field("left");
        if (!left.is("variable_name")) {
            return;
        }
        scopes_.bind(left.text(), resolver_.resolve(assignment.child_by_field("right")));
    }

    void Traverser::record_lazy_eager_load(const syntax::SyntaxNode& statement) {
        const auto expr = statement.named_child(0);
        if (!syntax::is_member_call(expr)) {
            return;
        }

        const auto chain = syntax::decompose_chain(expr);
        if (chain.root_kind != syntax::ChainRoot::Variable) {
            return;
        }

        Provenance provenance = scopes_.lookup(chain.root);
        bool changed = false;

        for (const auto& link : chain.links) {
            const bool loads =
                (provenance.kind == ProvenanceKind::EloquentBuilder && link.name == "with") ||
                (provenance.kind == ProvenanceKind::ModelClass &&
                 vocabulary::contains(vocabulary::LAZY_EAGER_LOADS, link.name));
            if (!loads) {
                continue;
            }
            for (auto& path : syntax::eager_load_paths(link.call)) {
                changed = provenance.eager_loads.insert(std::move(path)).second || changed;
            }
        }

        if (changed) {
            scopes_.bind(chain.root, std::move(provenance));
        }
    }

    void Traverser::record_foreach_binding(const syntax::SyntaxNode& loop) {
        const auto parts = foreach_parts(loop);
        if (parts.value.is_null()) {
            return;
        }

        Provenance source = resolver_.resolve(parts.source);
        if (source.kind == ProvenanceKind::EloquentBuilder) {
            // Iterating a builder runs it.
            source.kind = ProvenanceKind::ModelClass;
        } else if (source.kind != ProvenanceKind::ModelClass) {
            source = Provenance::unknown();
        }
        scopes_.bind(parts.value.text(), std::move(source));
    }

}  // namespace lpa::scope
