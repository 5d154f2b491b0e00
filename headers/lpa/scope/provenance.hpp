//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_PROVENANCE_HPP
#define LPA_PROVENANCE_HPP

/**
 * @file provenance.hpp
 * @brief What a variable is known to hold.
 *
 * Provenance is attached to variable bindings by the traversal and
 * propagates through fluent chains:
 *
 * @code
 *     $q = User::where('active', 1);     // EloquentBuilder(App\Models\User)
 *     $users = $q->with('team')->get();  // ModelClass(App\Models\User), eager {team}
 *     $rows = DB::table('jobs');         // QueryBuilder(jobs)
 * @endcode
 *
 * Anything the resolver cannot follow is Unknown. Terminal operations
 * that produce scalars (count, exists, sum) end the lineage.
 */

#include "lpa/syntax/syntax_tree.hpp"

#include <set>
#include <string>
#include <string_view>

namespace lpa::models {
    class ModelRegistry;
}

namespace lpa::scope {

    class ScopeTracker;

    enum class ProvenanceKind {
        Unknown,
        ModelClass,         ///< A model instance or a collection of models
        EloquentBuilder,    ///< An unexecuted Eloquent query
        QueryBuilder        ///< A raw query builder (DB::table or toBase())
    };

    const char* to_string(ProvenanceKind kind) noexcept;

    struct Provenance {
        ProvenanceKind kind = ProvenanceKind::Unknown;
        std::string subject;                    ///< Model FQN, or table name for QueryBuilder
        std::set<std::string> eager_loads;      ///< Dot-separated relation paths
        bool converted_from_eloquent = false;   ///< QueryBuilder obtained via toBase()/getQuery()

        static Provenance unknown() { return {}; }
        static Provenance model_class(std::string model);
        static Provenance eloquent_builder(std::string model);
        static Provenance query_builder(std::string table);

        [[nodiscard]] bool is_unknown() const noexcept { return kind == ProvenanceKind::Unknown; }

        /**
         * True for models, collections and Eloquent queries.
         */
        [[nodiscard]] bool is_model_derived() const noexcept {
            return kind == ProvenanceKind::ModelClass || kind == ProvenanceKind::EloquentBuilder;
        }

        /**
         * Checks whether a relation path is eager-loaded.
         *
         * A path is covered when it is loaded itself or is a prefix of a
         * loaded path: loading "user.team" covers "user".
         */
        [[nodiscard]] bool covers(std::string_view path) const;

        /**
         * Returns the provenance of a relation reached through path.
         *
         * The related model is not known statically; the eager loads below
         * path are carried over so nested loops see them.
         */
        [[nodiscard]] Provenance relation(std::string_view path) const;
    };

    /**
     * Decides whether a class is a model.
     *
     * The registry is authoritative for classes it has seen. Classes it
     * has not seen are judged by name: capitalized, not a framework facade
     * and not named after a non-model role (Controller, Service, ...).
     */
    [[nodiscard]] bool is_model_class(const models::ModelRegistry& registry, std::string_view qualified_name);

    [[nodiscard]] bool looks_like_model(std::string_view class_name);

    /**
     * Checks whether a class name as written refers to the DB facade.
     */
    [[nodiscard]] bool is_db_facade(std::string_view class_name) noexcept;

    /**
     * Computes the provenance of expressions against the current scope.
     */
    class ProvenanceResolver {
    public:
        explicit ProvenanceResolver(const ScopeTracker& scopes) noexcept
            : scopes_(scopes) {}

        [[nodiscard]] Provenance resolve(const syntax::SyntaxNode& expr) const;

    private:
        [[nodiscard]] Provenance resolve_chain(const syntax::SyntaxNode& expr) const;
        [[nodiscard]] Provenance resolve_property(const syntax::SyntaxNode& expr) const;

        const ScopeTracker& scopes_;
    };

}  // namespace lpa::scope

#endif //LPA_PROVENANCE_HPP
