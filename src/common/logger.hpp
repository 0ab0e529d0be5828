#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for Pagewise
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <string>

namespace pagewise {

/**
 * @brief Logger wrapper for Pagewise
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = "pagewise",
                     spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Get the logger instance, initializing it on first use
     *
     * Safe to call from several threads; must not race with shutdown().
     */
    static std::shared_ptr<spdlog::logger>& get();

    /**
     * @brief Set the log level
     */
    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    static void init_locked(const std::string& name,
                            spdlog::level::level_enum level);

    static std::shared_ptr<spdlog::logger> logger_;
    static std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(pagewise::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(pagewise::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(pagewise::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(pagewise::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(pagewise::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(pagewise::Logger::get(), __VA_ARGS__)

}  // namespace pagewise
