//
// Created by gregorian-rayne on 1/14/26.
//

#ifndef LPA_JSON_UTILS_HPP
#define LPA_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON output helpers shared by the exporters, the baseline and the registry cache.
 *
 * Output is built with nlohmann/json. Input is read with simdjson by the
 * individual loaders.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"
#include "lpa/types.hpp"
#include "lpa/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace lpa::json_utils {

    using json = nlohmann::json;

    /**
     * Serializes a JSON value and writes it, creating parent directories.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(const fs::path& path, const json& data, const int indent = 2) {
        std::string text;
        try {
            text = data.dump(indent, ' ', false, json::error_handler_t::replace);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }
        text += '\n';
        return file_utils::write_file(path, text);
    }

    /**
     * Formats a timestamp as ISO 8601 in UTC.
     */
    inline std::string format_timestamp(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);

        std::ostringstream ss;
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    inline double duration_to_ms(const Duration d) {
        return static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(d).count()) / 1000.0;
    }

}  // namespace lpa::json_utils

#endif //LPA_JSON_UTILS_HPP
