//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/query_patterns.hpp"

#include "lpa/analyzers/analyzer.hpp"
#include "lpa/scope/provenance.hpp"
#include "lpa/scope/vocabulary.hpp"

#include <array>

namespace lpa::analyzers
{
    namespace {

        namespace vocab = scope::vocabulary;

        /// DB facade methods that run a statement immediately.
        constexpr std::array<std::string_view, 7> DB_DIRECT_QUERIES = {
            "select", "selectOne", "insert", "update", "delete", "statement", "unprepared",
        };

        bool is_relation_query(const syntax::CallChain& chain) {
            // $model->relation()->...->terminal()
            if (chain.links.size() < 2) {
                return false;
            }
            const auto first = chain.links.front().name;
            return !is_query_terminal(first) &&
                   !vocab::contains(vocab::COLLECTION_PASSTHROUGH, first) &&
                   !vocab::contains(vocab::LAZY_EAGER_LOADS, first) &&
                   is_query_terminal(chain.last());
        }

    }  // namespace

    bool is_query_terminal(const std::string_view method) noexcept {
        return vocab::contains(vocab::COLLECTION_TERMINALS, method) ||
               vocab::contains(vocab::SINGLE_TERMINALS, method) ||
               vocab::contains(vocab::SCALAR_TERMINALS, method);
    }

    bool is_outermost_call(const syntax::SyntaxNode& call) noexcept {
        auto parent = call.parent();
        while (parent.is("parenthesized_expression")) {
            parent = parent.parent();
        }
        if (!syntax::is_member_call(parent)) {
            return true;
        }
        return !call.is_within(parent.child_by_field("object"));
    }

    bool is_model_rooted(const FileContext& context, const syntax::CallChain& chain) {
        if (chain.root_kind != syntax::ChainRoot::StaticClass || scope::is_db_facade(chain.root)) {
            return false;
        }
        const auto fqn = context.scopes().resolve_class(chain.root);
        return !fqn.empty() && scope::is_model_class(context.registry(), fqn);
    }

    bool is_db_rooted(const syntax::CallChain& chain) noexcept {
        return chain.root_kind == syntax::ChainRoot::StaticClass && scope::is_db_facade(chain.root);
    }

    bool is_query_call(const FileContext& context, const syntax::SyntaxNode& call) {
        if (!syntax::is_member_call(call) && !syntax::is_static_call(call)) {
            return false;
        }

        const auto chain = syntax::decompose_chain(call);
        if (chain.links.empty()) {
            return false;
        }

        switch (chain.root_kind) {
            case syntax::ChainRoot::StaticClass:
                if (is_db_rooted(chain)) {
                    const auto first = chain.links.front().name;
                    if (vocab::contains(DB_DIRECT_QUERIES, first)) {
                        return true;
                    }
                    return first == "table" && chain.links.size() > 1 && is_query_terminal(chain.last());
                }
                return is_model_rooted(context, chain) && is_query_terminal(chain.last());

            case syntax::ChainRoot::Variable: {
                const auto provenance = context.scopes().lookup(chain.root);
                switch (provenance.kind) {
                    case scope::ProvenanceKind::EloquentBuilder:
                    case scope::ProvenanceKind::QueryBuilder:
                        return is_query_terminal(chain.last());
                    case scope::ProvenanceKind::ModelClass:
                        return is_relation_query(chain);
                    case scope::ProvenanceKind::Unknown:
                        return false;
                }
                return false;
            }

            case syntax::ChainRoot::Property: {
                const auto provenance = context.provenance().resolve(chain.root_node);
                return provenance.kind == scope::ProvenanceKind::ModelClass && is_relation_query(chain);
            }

            case syntax::ChainRoot::None:
            case syntax::ChainRoot::Function:
            case syntax::ChainRoot::New:
            case syntax::ChainRoot::Other:
                return false;
        }
        return false;
    }

}  // namespace lpa::analyzers
