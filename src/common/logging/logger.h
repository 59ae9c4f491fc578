#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace splat::logging {

enum class LogLevel { trace, debug, info, warn, error, off };

// Configure the default logger.
// console=true logs to stderr with colours; otherwise output is discarded unless
// a log file is given.
void configure_logging(LogLevel level, bool console, const std::string& log_file = {});

std::shared_ptr<spdlog::logger> logger();

}  // namespace splat::logging

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::splat::logging::logger(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::splat::logging::logger(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::splat::logging::logger(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::splat::logging::logger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::splat::logging::logger(), __VA_ARGS__)
