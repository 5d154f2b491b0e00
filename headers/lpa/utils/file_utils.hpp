//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef LPA_FILE_UTILS_HPP
#define LPA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * All operations use Result<T, Error> for error handling.
 */

#include "lpa/result.hpp"
#include "lpa/error.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace lpa::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Writes a string to a file, creating parent directories as needed.
     *
     * @param path Path to the file.
     * @param content Content to write.
     * @return Success or an error.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Checks whether a path names a PHP source file.
     */
    inline bool is_php_source(const fs::path& path) {
        return path.extension() == ".php";
    }

}  // namespace lpa::file_utils

#endif //LPA_FILE_UTILS_HPP
