//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef LPA_LOGGING_HPP
#define LPA_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Library-wide spdlog logger.
 *
 * Library code logs through logging::get() unconditionally. Until init()
 * is called the returned logger discards everything, so tests and
 * embedders that never configure logging see no output.
 */

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace lpa::logging {

    inline constexpr const char* LOGGER_NAME = "lpa";

    struct LoggingConfig {
        std::string level = "warn";     ///< trace, debug, info, warn, error, critical, off
        std::string file;               ///< Optional log file, empty = none
        bool console = true;            ///< Colored stderr sink
    };

    /**
     * Installs the "lpa" logger with the configured sinks.
     *
     * Calling init() again replaces the previous logger.
     */
    void init(const LoggingConfig& config);

    /**
     * Returns the active logger. Never null.
     */
    std::shared_ptr<spdlog::logger> get();

    /**
     * Drops the configured logger and reverts to the discarding one.
     */
    void shutdown();

}  // namespace lpa::logging

#endif //LPA_LOGGING_HPP
