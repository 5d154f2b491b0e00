//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/scope/scope_tracker.hpp"
#include "lpa/models/model_registry.hpp"
#include "lpa/syntax/php_nodes.hpp"

#include <algorithm>
#include <ranges>
#include <unordered_set>

namespace lpa::scope {

    const char* to_string(const ScopeKind kind) noexcept {
        switch (kind) {
            case ScopeKind::File:           return "file";
            case ScopeKind::Namespace:      return "namespace";
            case ScopeKind::Class:          return "class";
            case ScopeKind::AnonymousClass: return "anonymous-class";
            case ScopeKind::Method:         return "method";
            case ScopeKind::Function:       return "function";
            case ScopeKind::Closure:        return "closure";
        }
        return "unknown";
    }

    ScopeTracker::ScopeTracker(const models::ModelRegistry& registry, const SuppressionIndex& suppressions)
        : registry_(registry), suppressions_(suppressions) {
        auto file = std::make_unique<Scope>();
        file->kind = ScopeKind::File;
        file->suppressed = suppressions_.file_rules();
        stack_.push_back(std::move(file));
    }

    void ScopeTracker::add_local_class(std::string qualified_name, std::string parent) {
        local_parents_[std::move(qualified_name)] = std::move(parent);
    }

    void ScopeTracker::enter_scope(const ScopeKind kind, const syntax::SyntaxNode& node, const bool transaction_protected) {
        auto frame = std::make_unique<Scope>();
        frame->kind = kind;
        frame->node = node;
        frame->parent = stack_.back().get();
        frame->transaction_protected = transaction_protected;

        switch (kind) {
            case ScopeKind::Namespace:
                frame->name = std::string(node.child_by_field("name").text());
                names_.set_namespace(frame->name);
                break;

            case ScopeKind::Class:
                frame->name = std::string(syntax::declaration_name(node));
                frame->qualified_name = names_.qualify_declaration(frame->name);
                if (const auto* rules = suppressions_.class_rules(node)) {
                    frame->suppressed = *rules;
                }
                [[fallthrough]];

            case ScopeKind::AnonymousClass:
                if (const auto base = syntax::base_class_name(node); !base.empty()) {
                    frame->parent_class = names_.resolve(base);
                }
                break;

            case ScopeKind::Method:
            case ScopeKind::Function:
                frame->name = std::string(syntax::declaration_name(node));
                break;

            case ScopeKind::File:
            case ScopeKind::Closure:
                break;
        }

        stack_.push_back(std::move(frame));
    }

    void ScopeTracker::leave_scope() {
        if (stack_.size() <= 1) {
            return;
        }
        if (stack_.back()->kind == ScopeKind::Namespace) {
            names_.set_namespace("");
        }
        stack_.pop_back();
    }

    const Scope* ScopeTracker::current_class() const noexcept {
        for (const auto& frame : stack_ | std::views::reverse) {
            if (frame->is_class()) {
                return frame.get();
            }
        }
        return nullptr;
    }

    const Scope* ScopeTracker::current_callable() const noexcept {
        for (const auto& frame : stack_ | std::views::reverse) {
            if (frame->is_callable()) {
                return frame.get();
            }
        }
        return nullptr;
    }

    const Scope* ScopeTracker::current_method() const noexcept {
        for (const auto& frame : stack_ | std::views::reverse) {
            if (frame->kind == ScopeKind::Method || frame->kind == ScopeKind::Function) {
                return frame.get();
            }
            if (frame->is_class()) {
                return nullptr;
            }
        }
        return nullptr;
    }

    std::vector<std::string> ScopeTracker::current_class_chain() const {
        std::vector<std::string> chain;
        const Scope* cls = current_class();
        if (cls == nullptr) {
            return chain;
        }

        std::unordered_set<std::string> visited;
        if (!cls->qualified_name.empty()) {
            visited.insert(cls->qualified_name);
        }

        std::string current = cls->parent_class;
        while (!current.empty()) {
            if (!visited.insert(current).second) {
                break;
            }
            chain.push_back(current);

            const auto local = local_parents_.find(current);
            if (local == local_parents_.end() && registry_.is_orm_base(current)) {
                break;
            }

            if (local != local_parents_.end()) {
                current = local->second;
            } else if (auto parent = registry_.parent_of(current)) {
                current = std::move(*parent);
            } else {
                break;
            }
        }

        return chain;
    }

    bool ScopeTracker::in_model_class() const {
        const Scope* cls = current_class();
        if (cls == nullptr) {
            return false;
        }
        if (!cls->qualified_name.empty() && registry_.is_model(cls->qualified_name)) {
            return true;
        }

        const auto chain = current_class_chain();
        return std::ranges::any_of(chain, [this](const std::string& ancestor) {
            return registry_.is_model(ancestor) ||
                   (!local_parents_.contains(ancestor) && registry_.is_orm_base(ancestor));
        });
    }

    Scope& ScopeTracker::binding_frame() noexcept {
        for (auto& frame : stack_ | std::views::reverse) {
            if (frame->is_callable()) {
                return *frame;
            }
        }
        return *stack_.front();
    }

    const Scope& ScopeTracker::binding_frame() const noexcept {
        for (const auto& frame : stack_ | std::views::reverse) {
            if (frame->is_callable()) {
                return *frame;
            }
        }
        return *stack_.front();
    }

    void ScopeTracker::bind(const std::string_view variable, Provenance provenance) {
        binding_frame().bindings[std::string(variable)] = std::move(provenance);
    }

    Provenance ScopeTracker::lookup(const std::string_view variable) const {
        if (variable == "$this") {
            return Provenance::unknown();
        }
        const auto& bindings = binding_frame().bindings;
        const auto it = bindings.find(std::string(variable));
        return it == bindings.end() ? Provenance::unknown() : it->second;
    }

    bool ScopeTracker::in_transaction() const noexcept {
        return std::ranges::any_of(stack_, [](const std::unique_ptr<Scope>& frame) {
            return frame->transaction_protected;
        });
    }

    bool ScopeTracker::is_suppressed(const std::string_view rule_id) const {
        return std::ranges::any_of(stack_, [rule_id](const std::unique_ptr<Scope>& frame) {
            return frame->suppressed.covers(rule_id);
        });
    }

    std::string ScopeTracker::resolve_class(const std::string_view written) const {
        const std::string resolved = names_.resolve(written);
        if (resolved == "self" || resolved == "static") {
            const Scope* cls = current_class();
            return cls == nullptr ? std::string{} : cls->qualified_name;
        }
        if (resolved == "parent") {
            const Scope* cls = current_class();
            return cls == nullptr ? std::string{} : cls->parent_class;
        }
        return resolved;
    }

}  // namespace lpa::scope
