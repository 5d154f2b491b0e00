//
// Created by gregorian-rayne on 1/13/26.
//

#include "lpa/utils/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>
#include <vector>

namespace lpa::logging {

    namespace {
        std::mutex g_mutex;
        std::shared_ptr<spdlog::logger> g_logger;

        std::shared_ptr<spdlog::logger> make_null_logger() {
            return std::make_shared<spdlog::logger>(LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
        }
    }

    void init(const LoggingConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.push_back(std::move(console_sink));
        }

        std::string file_error;
        if (!config.file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, true);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(std::move(file_sink));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.level));
        logger->flush_on(spdlog::level::warn);
        if (!file_error.empty()) {
            logger->warn("Cannot open log file {}: {}", config.file, file_error);
        }

        std::lock_guard lock(g_mutex);
        g_logger = std::move(logger);
    }

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard lock(g_mutex);
        if (!g_logger) {
            g_logger = make_null_logger();
        }
        return g_logger;
    }

    void shutdown() {
        std::lock_guard lock(g_mutex);
        if (g_logger) {
            g_logger->flush();
        }
        g_logger.reset();
    }

}  // namespace lpa::logging
