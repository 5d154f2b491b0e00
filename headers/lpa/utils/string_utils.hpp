//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef LPA_STRING_UTILS_HPP
#define LPA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Trimming, splitting, joining and the identifier conversions used when
 * mapping PHP class names to table names.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace lpa::string_utils {

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(std::string_view s) noexcept {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.remove_prefix(1);
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        return s;
    }

    /**
     * Splits a string by a delimiter.
     *
     * @param s The string to split.
     * @param delimiter The character to split on.
     * @return A vector of string views representing the parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Joins strings with a delimiter.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Case-insensitive ASCII comparison.
     */
    inline bool iequals(const std::string_view a, const std::string_view b) noexcept {
        return std::ranges::equal(a, b, [](const unsigned char x, const unsigned char y) {
            return std::tolower(x) == std::tolower(y);
        });
    }

    /**
     * Converts a StudlyCase identifier to snake_case.
     *
     * "OrderItem" -> "order_item", "HTTPLog" -> "h_t_t_p_log".
     * Acronyms are split per capital, which matches the framework's
     * Str::snake behaviour for class basenames.
     */
    inline std::string to_snake_case(const std::string_view s) {
        std::string result;
        result.reserve(s.size() + 4);

        for (std::size_t i = 0; i < s.size(); ++i) {
            const auto c = static_cast<unsigned char>(s[i]);
            if (std::isupper(c)) {
                if (i > 0 && result.back() != '_') {
                    result += '_';
                }
                result += static_cast<char>(std::tolower(c));
            } else {
                result += static_cast<char>(c);
            }
        }

        return result;
    }

    /**
     * Returns the part of a namespaced name after the last backslash.
     *
     * "App\\Models\\User" -> "User"
     */
    inline std::string_view basename(const std::string_view qualified) noexcept {
        const auto pos = qualified.rfind('\\');
        return pos == std::string_view::npos ? qualified : qualified.substr(pos + 1);
    }

    /**
     * Counts the lines in a block of text (a trailing newline does not start a new line).
     */
    inline std::size_t count_lines(const std::string_view s) noexcept {
        if (s.empty()) {
            return 0;
        }
        auto lines = static_cast<std::size_t>(std::ranges::count(s, '\n'));
        if (s.back() != '\n') {
            ++lines;
        }
        return lines;
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        result.reserve(s.size());

        std::size_t pos = 0;
        std::size_t found;

        while ((found = s.find(from, pos)) != std::string_view::npos) {
            result.append(s, pos, found - pos);
            result.append(to);
            pos = found + from.size();
        }

        result.append(s, pos, s.size() - pos);
        return result;
    }

}  // namespace lpa::string_utils

#endif //LPA_STRING_UTILS_HPP
