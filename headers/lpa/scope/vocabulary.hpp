//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_VOCABULARY_HPP
#define LPA_VOCABULARY_HPP

/**
 * @file vocabulary.hpp
 * @brief Method and class names with a fixed meaning in Laravel code.
 */

#include <algorithm>
#include <array>
#include <string_view>

namespace lpa::scope::vocabulary {

    template<std::size_t N>
    constexpr bool contains(const std::array<std::string_view, N>& list, const std::string_view name) noexcept {
        return std::ranges::find(list, name) != list.end();
    }

    /// Builder methods that execute the query and return a collection.
    inline constexpr std::array<std::string_view, 9> COLLECTION_TERMINALS = {
        "get", "all", "paginate", "simplePaginate", "cursorPaginate",
        "cursor", "lazy", "lazyById", "findMany",
    };

    /// Builder methods that execute the query and return a single model.
    inline constexpr std::array<std::string_view, 13> SINGLE_TERMINALS = {
        "first", "firstOrFail", "find", "findOrFail", "sole", "firstWhere",
        "findOrNew", "firstOrNew", "firstOrCreate", "updateOrCreate",
        "create", "forceCreate", "make",
    };

    /// Builder methods that execute the query and return a scalar or nothing.
    inline constexpr std::array<std::string_view, 22> SCALAR_TERMINALS = {
        "count", "exists", "doesntExist", "sum", "avg", "average", "max", "min",
        "pluck", "value", "implode", "delete", "update", "insert", "increment",
        "decrement", "upsert", "chunk", "chunkById", "each", "toSql", "dd",
    };

    /// Collection methods that keep the items (and therefore their loaded relations).
    inline constexpr std::array<std::string_view, 22> COLLECTION_PASSTHROUGH = {
        "filter", "reject", "sortBy", "sortByDesc", "sort", "values", "reverse",
        "unique", "take", "skip", "slice", "where", "whereIn", "whereNotIn",
        "whereNull", "whereNotNull", "shuffle", "merge", "keyBy", "tap",
        "fresh", "loadCount",
    };

    /// Methods that eager-load relations on an existing model or collection.
    inline constexpr std::array<std::string_view, 2> LAZY_EAGER_LOADS = {
        "load", "loadMissing",
    };

    /// Facades and classes that look like models but never are.
    inline constexpr std::array<std::string_view, 44> NON_MODEL_CLASSES = {
        "DB", "Cache", "Log", "Event", "Mail", "Queue", "Route", "Artisan",
        "Config", "Session", "Request", "Response", "Validator", "Hash",
        "Auth", "Gate", "Storage", "Redis", "RateLimiter", "Http", "View",
        "URL", "Cookie", "Crypt", "Lang", "Notification", "Password",
        "Schema", "Bus", "Broadcast", "File", "Blade", "App", "Date",
        "Str", "Arr", "Carbon", "Collection", "Process", "Pipeline",
        "Context", "Exception", "Throwable", "Closure",
    };

    /// Class-name suffixes of framework roles that are not models.
    inline constexpr std::array<std::string_view, 15> NON_MODEL_SUFFIXES = {
        "Controller", "Service", "Repository", "Helper", "Factory", "Job",
        "Listener", "Policy", "Request", "Resource", "Exception", "Facade",
        "Provider", "Middleware", "Command",
    };

}  // namespace lpa::scope::vocabulary

#endif //LPA_VOCABULARY_HPP
