//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_PATH_FILTER_HPP
#define LPA_PATH_FILTER_HPP

/**
 * @file path_filter.hpp
 * @brief Discovery of the PHP files to analyze.
 *
 * Exclusion patterns are globs matched case-insensitively against the
 * forward-slash path relative to the base directory. '*' matches any run
 * of characters including '/', '?' matches a single character.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/engine/engine.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace lpa::config {

    class Config;

    class PathFilter {
    public:
        PathFilter(fs::path base, std::vector<std::string> paths, std::vector<std::string> excluded);

        static PathFilter from_config(const Config& config);

        [[nodiscard]] bool is_excluded(std::string_view relative_path) const;

        /**
         * Walks every configured path below the base directory.
         *
         * Missing sub-paths are skipped. Files are deduplicated and sorted
         * by relative path.
         *
         * @return The PHP files to analyze, or NotFound when the base
         *         directory does not exist.
         */
        [[nodiscard]] Result<std::vector<engine::SourceFile>, Error> collect() const;

        [[nodiscard]] const fs::path& base() const noexcept { return base_; }

    private:
        fs::path base_;
        std::vector<std::string> paths_;
        std::vector<std::string> excluded_;
    };

}  // namespace lpa::config

#endif //LPA_PATH_FILTER_HPP
