//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/models/pluralizer.hpp"
#include "lpa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace lpa::models {

    namespace {
        constexpr std::array<std::pair<std::string_view, std::string_view>, 16> IRREGULAR = {{
            {"person", "people"},
            {"man", "men"},
            {"woman", "women"},
            {"child", "children"},
            {"mouse", "mice"},
            {"goose", "geese"},
            {"foot", "feet"},
            {"tooth", "teeth"},
            {"ox", "oxen"},
            {"criterion", "criteria"},
            {"phenomenon", "phenomena"},
            {"analysis", "analyses"},
            {"index", "indices"},
            {"matrix", "matrices"},
            {"vertex", "vertices"},
            {"quiz", "quizzes"},
        }};

        constexpr std::array<std::string_view, 44> UNCOUNTABLE = {
            "audio", "bison", "cattle", "chassis", "compensation", "coreopsis",
            "data", "deer", "education", "emoji", "equipment", "evidence",
            "feedback", "firmware", "fish", "furniture", "gold", "hardware",
            "information", "jedi", "kin", "knowledge", "love", "media", "metadata",
            "money", "moose", "news", "nutrition", "offspring", "plankton",
            "pokemon", "police", "rain", "recommended", "related", "rice", "series",
            "sheep", "software", "species", "swine", "traffic", "wheat",
        };

        // Words ending in "man" that take a plain "s".
        constexpr std::array<std::string_view, 8> MAN_TO_MANS = {
            "caiman", "cayman", "german", "human", "ottoman", "roman", "shaman", "talisman",
        };

        constexpr std::array<std::string_view, 13> F_TO_VES = {
            "calf", "elf", "half", "knife", "leaf", "life", "loaf",
            "self", "sheaf", "shelf", "thief", "wife", "wolf",
        };

        constexpr std::array<std::string_view, 6> O_TO_OES = {
            "echo", "hero", "potato", "tomato", "torpedo", "veto",
        };

        template<std::size_t N>
        bool in(const std::array<std::string_view, N>& list, const std::string_view word) {
            return std::ranges::find(list, word) != list.end();
        }

        bool is_vowel(const char c) noexcept {
            return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
        }
    }

    std::string pluralize(const std::string_view word) {
        if (word.empty()) {
            return {};
        }

        const std::string lower = string_utils::to_lower(word);

        if (in(UNCOUNTABLE, lower)) {
            return std::string(word);
        }

        for (const auto& [singular, plural] : IRREGULAR) {
            // Compound words keep their prefix: "salesperson" -> "salespeople".
            if (string_utils::ends_with(lower, singular)) {
                const auto prefix_len = word.size() - singular.size();
                if (prefix_len == 0 || singular.size() > 3) {
                    return std::string(word.substr(0, prefix_len)) + std::string(plural);
                }
            }
        }

        if (string_utils::ends_with(lower, "man") && !in(MAN_TO_MANS, lower)) {
            return std::string(word.substr(0, word.size() - 2)) + "en";
        }

        if (in(F_TO_VES, lower)) {
            const std::string_view stem = string_utils::ends_with(lower, "fe")
                ? word.substr(0, word.size() - 2)
                : word.substr(0, word.size() - 1);
            return std::string(stem) + "ves";
        }

        if (in(O_TO_OES, lower)) {
            return std::string(word) + "es";
        }

        if (string_utils::ends_with(lower, "sis")) {
            return std::string(word.substr(0, word.size() - 2)) + "es";
        }

        if (string_utils::ends_with(lower, "s") || string_utils::ends_with(lower, "x") ||
            string_utils::ends_with(lower, "z") || string_utils::ends_with(lower, "ch") ||
            string_utils::ends_with(lower, "sh")) {
            return std::string(word) + "es";
        }

        if (lower.size() > 1 && lower.back() == 'y' && !is_vowel(lower[lower.size() - 2])) {
            return std::string(word.substr(0, word.size() - 1)) + "ies";
        }

        return std::string(word) + "s";
    }

    std::string table_name_for_class(const std::string_view class_name) {
        const std::string snake = string_utils::to_snake_case(string_utils::basename(class_name));
        const auto last_separator = snake.rfind('_');

        if (last_separator == std::string::npos) {
            return pluralize(snake);
        }
        return snake.substr(0, last_separator + 1) + pluralize(std::string_view(snake).substr(last_separator + 1));
    }

}  // namespace lpa::models
