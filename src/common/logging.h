#pragma once

/// @file logging.h
/// @brief IPI-Shield logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ipishield {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "ipishield";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // Console output goes to stderr so the CLI can keep stdout for reports
    bool console_to_stderr = true;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "ipishield.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global logger with the given configuration.
/// Only the first call takes effect.
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance, initializing defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
/// "critical", "off"), case-insensitive
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define IPISHIELD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::ipishield::GetLogger(), __VA_ARGS__)
#define IPISHIELD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::ipishield::GetLogger(), __VA_ARGS__)
#define IPISHIELD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::ipishield::GetLogger(), __VA_ARGS__)
#define IPISHIELD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::ipishield::GetLogger(), __VA_ARGS__)
#define IPISHIELD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::ipishield::GetLogger(), __VA_ARGS__)
#define IPISHIELD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::ipishield::GetLogger(), __VA_ARGS__)

}  // namespace ipishield
