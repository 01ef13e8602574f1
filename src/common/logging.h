#pragma once

/// @file logging.h
/// @brief pglogstats logging utilities wrapping spdlog

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace pglogstats {

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
///
/// Diagnostics go to stderr so a report written to stdout stays machine
/// readable.
struct LogConfig {
    std::string name = "pglogstats";
    LogLevel level = LogLevel::kWarn;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "pglogstats.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;
};

/// @brief Initialize the global logger with the given configuration
///
/// No-op while a logger is installed; after ShutdownLogging() the next call
/// (or the next GetLogger()) installs a fresh one.
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off")
/// @return The level, or std::nullopt when the name is not recognized
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

/// @brief Initializes logging on construction and flushes and shuts it down
///        on destruction, whichever path leaves the scope
class ScopedLogging {
public:
    explicit ScopedLogging(const LogConfig& config = {});
    ~ScopedLogging();

    ScopedLogging(const ScopedLogging&) = delete;
    ScopedLogging& operator=(const ScopedLogging&) = delete;
};

// Convenience macros for logging
#define PGLOGSTATS_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::pglogstats::GetLogger(), __VA_ARGS__)
#define PGLOGSTATS_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::pglogstats::GetLogger(), __VA_ARGS__)
#define PGLOGSTATS_LOG_INFO(...) SPDLOG_LOGGER_INFO(::pglogstats::GetLogger(), __VA_ARGS__)
#define PGLOGSTATS_LOG_WARN(...) SPDLOG_LOGGER_WARN(::pglogstats::GetLogger(), __VA_ARGS__)
#define PGLOGSTATS_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::pglogstats::GetLogger(), __VA_ARGS__)
#define PGLOGSTATS_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::pglogstats::GetLogger(), __VA_ARGS__)

}  // namespace pglogstats
