/**
 * @file logger.h
 * @brief Structured logging API for the podium delivery analyzer
 *
 * Provides a unified logging interface using spdlog.
 * Supports console output, rotating file output, and configurable log levels.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
namespace sinks {
class sink;
}  // namespace sinks
}  // namespace spdlog

namespace podium {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Per-frame and per-interval detail
    Debug,     // Stage internals (counts, thresholds)
    Info,      // Stage progress and written artifacts
    Warn,      // Recoverable problems (config fallbacks, skipped records)
    Error,     // Run-level failures
    Critical,  // Unrecoverable failures
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);  // 10 MB
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used by the command line tools before the config file has been read.
 * Can be followed by initializeFromConfig() for full initialization.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initializeEarly();

/**
 * @brief Initialize logging from JSON config file
 *
 * Reads the "logging" section from the config file.
 * Falls back to defaults if the file or the section is missing.
 *
 * @param configPath Path to JSON config file
 * @return true if initialization succeeded, false otherwise
 */
bool initializeFromConfig(const std::string& configPath);

/**
 * @brief Shutdown the logging system
 *
 * Flushes all pending log messages and releases resources.
 */
void shutdown();

/**
 * @brief Set the global log level
 */
void setLevel(LogLevel level);

/**
 * @brief Get the current log level
 */
LogLevel getLevel();

/**
 * @brief Flush all pending log messages
 */
void flush();

std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Copies log output into a per-run file while in scope.
 *
 * The file is truncated on open and detached on destruction. Attach and detach
 * must not race with each other; logging from worker threads in between is fine.
 */
class ScopedRunLog {
   public:
    explicit ScopedRunLog(const std::string& path);
    ~ScopedRunLog();

    ScopedRunLog(const ScopedRunLog&) = delete;
    ScopedRunLog& operator=(const ScopedRunLog&) = delete;

    bool attached() const {
        return sink_ != nullptr;
    }

   private:
    std::shared_ptr<spdlog::sinks::sink> sink_;
};

/**
 * @brief Convert LogLevel to string
 */
std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace podium

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

// ============================================================
// Logging macros - Use these instead of calling spdlog directly
// ============================================================

#define LOG_TRACE(...)                                \
    do {                                              \
        auto logger = podium::logging::getLogger();   \
        if (logger)                                   \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...)                                \
    do {                                              \
        auto logger = podium::logging::getLogger();   \
        if (logger)                                   \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(...)                                \
    do {                                             \
        auto logger = podium::logging::getLogger();  \
        if (logger)                                  \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__); \
    } while (0)

#define LOG_WARN(...)                                \
    do {                                             \
        auto logger = podium::logging::getLogger();  \
        if (logger)                                  \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__); \
    } while (0)

#define LOG_ERROR(...)                                \
    do {                                              \
        auto logger = podium::logging::getLogger();   \
        if (logger)                                   \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__); \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = podium::logging::getLogger();      \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

/**
 * @brief Log if condition is true
 */
#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log at most once
 *
 * Useful for one-time warnings (e.g. a fallback taken for every clip).
 */
#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
