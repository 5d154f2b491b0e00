//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_REGISTRY_CACHE_HPP
#define LPA_REGISTRY_CACHE_HPP

/**
 * @file registry_cache.hpp
 * @brief On-disk cache of resolved model registries.
 *
 * Cache files are named models-<key>.json, where the key is a SHA-256
 * over the scanned model directories, every model file's path, size and
 * modification time, and the registry options. Any change to a model
 * file therefore produces a new key and a rebuild.
 */

#include "lpa/models/model_registry.hpp"
#include "lpa/result.hpp"
#include "lpa/error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lpa::models {

    class RegistryCache {
    public:
        explicit RegistryCache(fs::path directory);

        [[nodiscard]] const fs::path& directory() const noexcept { return directory_; }

        /**
         * Computes the cache key for a set of model directories.
         */
        [[nodiscard]] static std::string compute_key(const std::vector<fs::path>& model_dirs,
                                                     const RegistryOptions& options);

        [[nodiscard]] fs::path path_for(std::string_view key) const;

        /**
         * Loads a cached registry.
         *
         * @return The registry, or nullopt on a miss or an unreadable file.
         */
        [[nodiscard]] std::optional<ModelRegistry> load(std::string_view key) const;

        [[nodiscard]] Result<void, Error> store(std::string_view key, const ModelRegistry& registry) const;

        /**
         * Deletes every cache file in the cache directory.
         *
         * @return Number of files removed.
         */
        [[nodiscard]] Result<std::size_t, Error> clear() const;

        [[nodiscard]] static std::string serialize(const ModelRegistry& registry);
        [[nodiscard]] static Result<ModelRegistry, Error> deserialize(std::string_view json);

    private:
        fs::path directory_;
    };

    /**
     * Builds the registry for a set of model directories.
     *
     * When a cache is supplied a valid cache file is used instead of
     * scanning, and a freshly built registry is written back. Cache
     * failures are logged and never fail the build.
     */
    [[nodiscard]] ModelRegistry load_registry(const std::vector<fs::path>& model_dirs,
                                              const RegistryOptions& options,
                                              const RegistryCache* cache = nullptr);

}  // namespace lpa::models

#endif //LPA_REGISTRY_CACHE_HPP
