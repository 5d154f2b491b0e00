//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/scope/provenance.hpp"
#include "lpa/scope/scope_tracker.hpp"
#include "lpa/scope/vocabulary.hpp"
#include "lpa/models/model_registry.hpp"
#include "lpa/syntax/php_nodes.hpp"
#include "lpa/utils/string_utils.hpp"

#include <cctype>

namespace lpa::scope {

    namespace {
        void add_eager_loads(Provenance& provenance, const syntax::SyntaxNode& call) {
            for (auto& path : syntax::eager_load_paths(call)) {
                provenance.eager_loads.insert(std::move(path));
            }
        }

        Provenance apply_call(Provenance current, const syntax::ChainLink& link) {
            using namespace vocabulary;
            const auto name = link.name;

            switch (current.kind) {
                case ProvenanceKind::EloquentBuilder:
                    if (name == "with") {
                        add_eager_loads(current, link.call);
                    } else if (name == "toBase" || name == "getQuery") {
                        current.kind = ProvenanceKind::QueryBuilder;
                        current.converted_from_eloquent = true;
                    } else if (contains(COLLECTION_TERMINALS, name) || contains(SINGLE_TERMINALS, name)) {
                        current.kind = ProvenanceKind::ModelClass;
                    } else if (contains(SCALAR_TERMINALS, name)) {
                        return Provenance::unknown();
                    }
                    return current;

                case ProvenanceKind::ModelClass:
                    if (contains(LAZY_EAGER_LOADS, name)) {
                        add_eager_loads(current, link.call);
                        return current;
                    }
                    if (contains(COLLECTION_PASSTHROUGH, name) || name == "refresh") {
                        return current;
                    }
                    return Provenance::unknown();

                case ProvenanceKind::QueryBuilder:
                    if (contains(COLLECTION_TERMINALS, name) || contains(SINGLE_TERMINALS, name) ||
                        contains(SCALAR_TERMINALS, name)) {
                        return Provenance::unknown();
                    }
                    return current;

                case ProvenanceKind::Unknown:
                    break;
            }
            return Provenance::unknown();
        }
    }

    const char* to_string(const ProvenanceKind kind) noexcept {
        switch (kind) {
            case ProvenanceKind::Unknown:         return "unknown";
            case ProvenanceKind::ModelClass:      return "model";
            case ProvenanceKind::EloquentBuilder: return "eloquent-builder";
            case ProvenanceKind::QueryBuilder:    return "query-builder";
        }
        return "unknown";
    }

    // ============================================================================
    // Provenance
    // ============================================================================

    Provenance Provenance::model_class(std::string model) {
        Provenance p;
        p.kind = ProvenanceKind::ModelClass;
        p.subject = std::move(model);
        return p;
    }

    Provenance Provenance::eloquent_builder(std::string model) {
        Provenance p;
        p.kind = ProvenanceKind::EloquentBuilder;
        p.subject = std::move(model);
        return p;
    }

    Provenance Provenance::query_builder(std::string table) {
        Provenance p;
        p.kind = ProvenanceKind::QueryBuilder;
        p.subject = std::move(table);
        return p;
    }

    bool Provenance::covers(const std::string_view path) const {
        for (const auto& loaded : eager_loads) {
            if (loaded == path) {
                return true;
            }
            if (loaded.size() > path.size() && string_utils::starts_with(loaded, path) && loaded[path.size()] == '.') {
                return true;
            }
        }
        return false;
    }

    Provenance Provenance::relation(const std::string_view path) const {
        Provenance related = model_class("");
        const std::string prefix = std::string(path) + ".";
        for (const auto& loaded : eager_loads) {
            if (string_utils::starts_with(loaded, prefix)) {
                related.eager_loads.insert(loaded.substr(prefix.size()));
            }
        }
        return related;
    }

    // ============================================================================
    // Model classification
    // ============================================================================

    bool looks_like_model(const std::string_view class_name) {
        const auto short_name = string_utils::basename(class_name);
        if (short_name.empty() || !std::isupper(static_cast<unsigned char>(short_name.front()))) {
            return false;
        }
        if (vocabulary::contains(vocabulary::NON_MODEL_CLASSES, short_name)) {
            return false;
        }
        for (const auto suffix : vocabulary::NON_MODEL_SUFFIXES) {
            if (string_utils::ends_with(short_name, suffix)) {
                return false;
            }
        }
        // Framework namespaces never hold application models.
        return !string_utils::starts_with(class_name, "Illuminate\\");
    }

    bool is_model_class(const models::ModelRegistry& registry, const std::string_view qualified_name) {
        if (qualified_name.empty()) {
            return false;
        }
        if (registry.knows_class(qualified_name)) {
            return registry.is_model(qualified_name);
        }
        return looks_like_model(qualified_name);
    }

    bool is_db_facade(const std::string_view class_name) noexcept {
        return class_name == "DB" || class_name == "\\DB" ||
               string_utils::ends_with(class_name, "Facades\\DB");
    }

    // ============================================================================
    // ProvenanceResolver
    // ============================================================================

    Provenance ProvenanceResolver::resolve(const syntax::SyntaxNode& expr) const {
        const auto node = syntax::unwrap_parentheses(expr);

        if (node.is("variable_name")) {
            return scopes_.lookup(node.text());
        }

        if (node.is("object_creation_expression") && !syntax::is_anonymous_class(node)) {
            const auto chain = syntax::decompose_chain(node);
            const auto fqn = scopes_.resolve_class(chain.root);
            if (is_model_class(scopes_.registry(), fqn)) {
                return Provenance::model_class(fqn);
            }
            return Provenance::unknown();
        }

        if (syntax::is_property_access(node)) {
            return resolve_property(node);
        }

        if (syntax::is_member_call(node) || syntax::is_static_call(node)) {
            return resolve_chain(node);
        }

        if (node.is("assignment_expression")) {
            return resolve(node.child_by_field("right"));
        }

        return Provenance::unknown();
    }

    Provenance ProvenanceResolver::resolve_property(const syntax::SyntaxNode& expr) const {
        const auto chain = syntax::property_chain(expr);
        if (!chain) {
            return Provenance::unknown();
        }

        const auto base = scopes_.lookup(chain->variable);
        if (base.kind != ProvenanceKind::ModelClass) {
            return Provenance::unknown();
        }
        return base.relation(string_utils::join(chain->segments, "."));
    }

    Provenance ProvenanceResolver::resolve_chain(const syntax::SyntaxNode& expr) const {
        const auto chain = syntax::decompose_chain(expr);
        Provenance current;
        std::size_t first_link = 0;

        switch (chain.root_kind) {
            case syntax::ChainRoot::Variable:
                current = scopes_.lookup(chain.root);
                break;

            case syntax::ChainRoot::StaticClass: {
                if (is_db_facade(chain.root)) {
                    if (chain.links.empty() || chain.links.front().name != "table") {
                        return Provenance::unknown();
                    }
                    const auto table = syntax::string_literal(syntax::first_argument(chain.links.front().call));
                    if (!table) {
                        return Provenance::unknown();
                    }
                    current = Provenance::query_builder(*table);
                    first_link = 1;
                    break;
                }
                const auto fqn = scopes_.resolve_class(chain.root);
                if (!is_model_class(scopes_.registry(), fqn)) {
                    return Provenance::unknown();
                }
                current = Provenance::eloquent_builder(fqn);
                break;
            }

            case syntax::ChainRoot::New:
            case syntax::ChainRoot::Property:
                current = resolve(chain.root_node);
                break;

            case syntax::ChainRoot::None:
            case syntax::ChainRoot::Function:
            case syntax::ChainRoot::Other:
                return Provenance::unknown();
        }

        for (std::size_t i = first_link; i < chain.links.size() && !current.is_unknown(); ++i) {
            current = apply_call(std::move(current), chain.links[i]);
        }
        return current;
    }

}  // namespace lpa::scope
