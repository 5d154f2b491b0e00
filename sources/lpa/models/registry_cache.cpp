//
// Created by gregorian-rayne on 1/14/26.
//

#include "lpa/models/registry_cache.hpp"
#include "lpa/utils/file_utils.hpp"
#include "lpa/utils/hash_utils.hpp"
#include "lpa/utils/logging.hpp"
#include "lpa/utils/path_utils.hpp"
#include "lpa/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <algorithm>
#include <sstream>

namespace lpa::models {

    namespace {
        constexpr int CACHE_FORMAT_VERSION = 1;
        constexpr std::string_view CACHE_PREFIX = "models-";
        constexpr std::string_view CACHE_SUFFIX = ".json";

        std::vector<fs::path> php_files_under(const fs::path& directory) {
            std::vector<fs::path> files;
            std::error_code ec;
            if (!fs::is_directory(directory, ec)) {
                return files;
            }
            for (auto it = fs::recursive_directory_iterator(directory, fs::directory_options::skip_permission_denied, ec);
                 !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_regular_file(ec) && file_utils::is_php_source(it->path())) {
                    files.push_back(it->path());
                }
            }
            std::ranges::sort(files);
            return files;
        }
    }

    RegistryCache::RegistryCache(fs::path directory)
        : directory_(std::move(directory)) {}

    std::string RegistryCache::compute_key(const std::vector<fs::path>& model_dirs, const RegistryOptions& options) {
        std::vector<fs::path> dirs = model_dirs;
        std::ranges::sort(dirs);

        std::ostringstream material;
        material << "v" << CACHE_FORMAT_VERSION << '\n';

        for (const auto& dir : dirs) {
            material << "dir:" << path_utils::to_forward_slashes(dir) << '\n';
            for (const auto& file : php_files_under(dir)) {
                std::error_code ec;
                const auto size = fs::file_size(file, ec);
                const auto mtime = fs::last_write_time(file, ec).time_since_epoch().count();
                material << path_utils::to_forward_slashes(file) << '|' << size << '|' << mtime << '\n';
            }
        }

        std::vector<std::string> bases = options.base_classes;
        std::ranges::sort(bases);
        material << "bases:" << string_utils::join(bases, ",") << '\n';
        for (const auto& [cls, table] : options.table_mappings) {
            material << "map:" << cls << '=' << table << '\n';
        }

        return utils::compute_sha256(material.str());
    }

    fs::path RegistryCache::path_for(const std::string_view key) const {
        return directory_ / (std::string(CACHE_PREFIX) + std::string(key) + std::string(CACHE_SUFFIX));
    }

    std::optional<ModelRegistry> RegistryCache::load(const std::string_view key) const {
        const auto path = path_for(key);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            logging::get()->debug("Registry cache miss: {}", path.string());
            return std::nullopt;
        }

        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            logging::get()->warn("Cannot read registry cache {}: {}", path.string(), content.error().to_string());
            return std::nullopt;
        }

        auto registry = deserialize(content.value());
        if (registry.is_err()) {
            logging::get()->warn("Ignoring corrupt registry cache {}: {}", path.string(), registry.error().to_string());
            return std::nullopt;
        }

        logging::get()->debug("Registry cache hit: {}", path.string());
        return std::move(registry).value();
    }

    Result<void, Error> RegistryCache::store(const std::string_view key, const ModelRegistry& registry) const {
        if (auto written = file_utils::write_file(path_for(key), serialize(registry)); written.is_err()) {
            return Result<void, Error>::failure(
                Error::cache_error("Failed to write registry cache", written.error().to_string())
            );
        }
        return Result<void, Error>::success();
    }

    Result<std::size_t, Error> RegistryCache::clear() const {
        std::error_code ec;
        if (!fs::is_directory(directory_, ec)) {
            return Result<std::size_t, Error>::success(0);
        }

        std::size_t removed = 0;
        for (const auto& entry : fs::directory_iterator(directory_, ec)) {
            const auto name = entry.path().filename().string();
            if (!string_utils::starts_with(name, CACHE_PREFIX) || !string_utils::ends_with(name, CACHE_SUFFIX)) {
                continue;
            }
            if (!fs::remove(entry.path(), ec) || ec) {
                return Result<std::size_t, Error>::failure(
                    Error::cache_error("Failed to remove cache file", entry.path().string())
                );
            }
            ++removed;
        }

        if (ec) {
            return Result<std::size_t, Error>::failure(
                Error::cache_error("Failed to list cache directory", directory_.string())
            );
        }
        return Result<std::size_t, Error>::success(removed);
    }

    std::string RegistryCache::serialize(const ModelRegistry& registry) {
        nlohmann::json output;
        output["version"] = CACHE_FORMAT_VERSION;

        std::vector<std::string> bases(registry.orm_bases_.begin(), registry.orm_bases_.end());
        std::ranges::sort(bases);
        output["orm_bases"] = bases;

        nlohmann::json classes = nlohmann::json::object();
        for (const auto& [name, parent] : registry.parents_) {
            classes[name] = parent;
        }
        output["classes"] = std::move(classes);

        nlohmann::json models = nlohmann::json::array();
        for (const auto& entry : registry.entries()) {
            models.push_back({
                {"class", entry.class_name},
                {"table", entry.table},
                {"parent", entry.parent},
                {"file", entry.file.string()}
            });
        }
        output["models"] = std::move(models);

        return output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    Result<ModelRegistry, Error> RegistryCache::deserialize(const std::string_view json) {
        using namespace simdjson;

        dom::parser parser;
        const padded_string padded(json);
        dom::element doc;
        if (parser.parse(padded).get(doc)) {
            return Result<ModelRegistry, Error>::failure(
                Error::cache_error("Failed to parse registry cache JSON")
            );
        }

        int64_t version = 0;
        if (doc["version"].get<int64_t>().get(version) || version != CACHE_FORMAT_VERSION) {
            return Result<ModelRegistry, Error>::failure(
                Error::cache_error("Unsupported registry cache version", std::to_string(version))
            );
        }

        ModelRegistry registry;

        if (auto bases = doc["orm_bases"]; !bases.error()) {
            for (auto b : bases.get_array().value()) {
                if (auto v = b.get<std::string_view>(); !v.error()) {
                    registry.orm_bases_.emplace(v.value());
                }
            }
        }

        if (auto classes = doc["classes"]; !classes.error()) {
            for (auto [name, parent] : classes.get_object().value()) {
                if (auto v = parent.get<std::string_view>(); !v.error()) {
                    registry.parents_.emplace(std::string(name), std::string(v.value()));
                }
            }
        }

        if (auto models = doc["models"]; !models.error()) {
            for (auto elem : models.get_array().value()) {
                auto obj = elem.get<dom::object>().value();
                ModelEntry entry;
                if (auto v = obj["class"].get<std::string_view>(); !v.error()) {
                    entry.class_name = std::string(v.value());
                }
                if (auto v = obj["table"].get<std::string_view>(); !v.error()) {
                    entry.table = std::string(v.value());
                }
                if (auto v = obj["parent"].get<std::string_view>(); !v.error()) {
                    entry.parent = std::string(v.value());
                }
                if (auto v = obj["file"].get<std::string_view>(); !v.error()) {
                    entry.file = std::string(v.value());
                }
                if (entry.class_name.empty()) {
                    continue;
                }
                if (!entry.table.empty()) {
                    registry.tables_.insert(entry.table);
                }
                registry.models_[entry.class_name] = std::move(entry);
            }
        }

        return Result<ModelRegistry, Error>::success(std::move(registry));
    }

    ModelRegistry load_registry(const std::vector<fs::path>& model_dirs,
                                const RegistryOptions& options,
                                const RegistryCache* cache) {
        std::string key;
        if (cache != nullptr) {
            key = RegistryCache::compute_key(model_dirs, options);
            if (auto cached = cache->load(key)) {
                return std::move(*cached);
            }
        }

        RegistryBuilder builder(options);
        for (const auto& dir : model_dirs) {
            builder.scan_directory(dir);
        }
        ModelRegistry registry = builder.build();

        if (cache != nullptr) {
            if (auto stored = cache->store(key, registry); stored.is_err()) {
                logging::get()->warn("{}", stored.error().to_string());
            }
        }

        return registry;
    }

}  // namespace lpa::models
