//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef LPA_ERROR_HPP
#define LPA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error carried by a failed Result.
 *
 * An Error has a code, a message and an optional context: the file,
 * configuration key or analyzer id the failure concerns. to_string()
 * renders "[Code] message (context: ...)", which is what the CLI prints.
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace lpa {

    enum class ErrorCode {
        InvalidArgument,  ///< Unknown analyzer, format or fail-on level
        NotFound,         ///< Missing directory or model
        ParseError,       ///< PHP, TOML or JSON could not be parsed
        IoError,          ///< Reading or writing a file failed
        ConfigError,      ///< Configuration failed validation
        CacheError,       ///< Registry cache could not be read or written
        InternalError     ///< Parser setup or serialization failure
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::CacheError:      return "CacheError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    class Error {
    public:
        Error(const ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error cache_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::CacheError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        /**
         * Returns a copy with more context, joined to any existing context
         * with "; ". Used when a failure is passed up through a file load.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

}  // namespace lpa

#endif //LPA_ERROR_HPP
