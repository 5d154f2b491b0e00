//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_PLURALIZER_HPP
#define LPA_PLURALIZER_HPP

#include <string>
#include <string_view>

namespace lpa::models {

    /**
     * Pluralizes a lowercase English noun.
     *
     * Handles irregular forms (person -> people, child -> children),
     * uncountable nouns (equipment, information), sibilant endings
     * (status -> statuses, box -> boxes), consonant-y (category ->
     * categories), f/fe -> ves for the common cases and -o -> -oes for
     * the nouns that take it. Everything else gets a trailing "s".
     */
    [[nodiscard]] std::string pluralize(std::string_view word);

    /**
     * Derives the conventional table name for a model class.
     *
     * The unqualified class name is converted to snake_case and its last
     * word is pluralized: "App\\Models\\OrderItem" -> "order_items",
     * "Person" -> "people".
     */
    [[nodiscard]] std::string table_name_for_class(std::string_view class_name);

}  // namespace lpa::models

#endif //LPA_PLURALIZER_HPP
