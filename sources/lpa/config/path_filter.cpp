//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/config/path_filter.hpp"
#include "lpa/config/config.hpp"

#include "lpa/utils/file_utils.hpp"
#include "lpa/utils/logging.hpp"
#include "lpa/utils/path_utils.hpp"

#include <algorithm>
#include <map>
#include <system_error>

namespace lpa::config
{
    PathFilter::PathFilter(fs::path base, std::vector<std::string> paths, std::vector<std::string> excluded)
        : base_(std::move(base)), paths_(std::move(paths)), excluded_(std::move(excluded)) {}

    PathFilter PathFilter::from_config(const Config& config) {
        return PathFilter(config.general.base_path, config.general.paths, config.general.excluded_paths);
    }

    bool PathFilter::is_excluded(const std::string_view relative_path) const {
        return std::ranges::any_of(excluded_, [relative_path](const std::string& pattern) {
            return path_utils::glob_match(relative_path, pattern);
        });
    }

    Result<std::vector<engine::SourceFile>, Error> PathFilter::collect() const {
        using ResultType = Result<std::vector<engine::SourceFile>, Error>;

        std::error_code ec;
        if (!fs::is_directory(base_, ec)) {
            return ResultType::failure(Error::not_found("Base directory does not exist", base_.string()));
        }

        std::map<std::string, fs::path> found;      // relative path -> path
        const auto consider = [&](const fs::path& file) {
            if (!file_utils::is_php_source(file)) {
                return;
            }
            auto relative = path_utils::to_forward_slashes(path_utils::make_relative(file, base_));
            if (is_excluded(relative)) {
                return;
            }
            found.try_emplace(std::move(relative), file);
        };

        for (const auto& sub_path : paths_) {
            const fs::path root = sub_path.empty() || sub_path == "." ? base_ : base_ / sub_path;

            if (fs::is_regular_file(root, ec)) {
                consider(root);
                continue;
            }
            if (!fs::is_directory(root, ec)) {
                logging::get()->debug("Path {} does not exist, skipping", root.string());
                continue;
            }

            fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                logging::get()->warn("Cannot read directory {}: {}", root.string(), ec.message());
                continue;
            }

            for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) {
                    logging::get()->warn("Error while walking {}: {}", root.string(), ec.message());
                    break;
                }
                const auto& entry = *it;
                if (entry.is_directory(ec)) {
                    const auto relative = path_utils::to_forward_slashes(
                        path_utils::make_relative(entry.path(), base_)) + "/";
                    if (is_excluded(relative)) {
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                if (entry.is_regular_file(ec)) {
                    consider(entry.path());
                }
            }
        }

        std::vector<engine::SourceFile> files;
        files.reserve(found.size());
        for (auto& [relative, path] : found) {
            files.push_back({path, relative});
        }

        logging::get()->info("Discovered {} PHP files under {}", files.size(), base_.string());
        return ResultType::success(std::move(files));
    }

}  // namespace lpa::config
