//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef LPA_PATH_UTILS_HPP
#define LPA_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path manipulation and glob matching.
 */

#include <filesystem>
#include <string>
#include <string_view>
#include <cctype>

namespace lpa::path_utils {

    namespace fs = std::filesystem;

    /**
     * Makes a path relative to a base directory.
     *
     * @return The relative path, or the original if not possible.
     */
    inline fs::path make_relative(const fs::path& path, const fs::path& base) {
        std::error_code ec;
        auto result = fs::relative(path, base, ec);

        if (ec || result.empty() || *result.begin() == "..") {
            return path;
        }

        return result;
    }

    /**
     * Converts a path to use forward slashes.
     */
    inline std::string to_forward_slashes(const fs::path& path) {
        std::string result = path.string();
        for (char& c : result) {
            if (c == '\\') {
                c = '/';
            }
        }
        return result;
    }

    /**
     * Matches a path against a glob pattern.
     *
     * '*' matches any run of characters including '/', '?' matches exactly
     * one character. Matching is anchored at both ends and case-insensitive.
     * "vendor/*" therefore matches every file below vendor/.
     */
    inline bool glob_match(const std::string_view text, const std::string_view pattern) noexcept {
        std::size_t t = 0;
        std::size_t p = 0;
        std::size_t star_p = std::string_view::npos;
        std::size_t star_t = 0;

        const auto same = [](const char a, const char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        };

        while (t < text.size()) {
            if (p < pattern.size() && (pattern[p] == '?' || same(pattern[p], text[t]))) {
                ++t;
                ++p;
            } else if (p < pattern.size() && pattern[p] == '*') {
                star_p = p++;
                star_t = t;
            } else if (star_p != std::string_view::npos) {
                p = star_p + 1;
                t = ++star_t;
            } else {
                return false;
            }
        }

        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }

    /**
     * Checks whether any directory component of a forward-slash path equals segment.
     */
    inline bool has_directory(const std::string_view path, const std::string_view segment) {
        std::size_t start = 0;
        while (start < path.size()) {
            const auto end = path.find('/', start);
            if (end == std::string_view::npos) {
                return false;   // last component is the file name
            }
            if (path.substr(start, end - start) == segment) {
                return true;
            }
            start = end + 1;
        }
        return false;
    }

    /**
     * Checks whether a forward-slash path lies below a directory given as
     * one or more leading components ("database/seeders"), at the root or
     * nested anywhere.
     */
    inline bool is_within_directory(const std::string_view path, const std::string_view directory) {
        if (directory.empty() || path.size() <= directory.size()) {
            return false;
        }
        for (auto pos = path.find(directory); pos != std::string_view::npos; pos = path.find(directory, pos + 1)) {
            const bool starts_component = pos == 0 || path[pos - 1] == '/';
            const auto end = pos + directory.size();
            if (starts_component && end < path.size() && path[end] == '/') {
                return true;
            }
        }
        return false;
    }

}  // namespace lpa::path_utils

#endif //LPA_PATH_UTILS_HPP
