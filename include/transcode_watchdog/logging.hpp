/**
 * @file logging.hpp
 * @brief Logging macros and activity log file
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - An optional activity log file that receives every line with a
 *            timestamp and level, in addition to the colored console output
 *
 * @note All logs use fmt for type-safe formatting and are flushed
 *       immediately so a hung external tool never hides earlier output.
 *
 */

#ifndef TRANSCODE_WATCHDOG_LOGGING_HPP
#define TRANSCODE_WATCHDOG_LOGGING_HPP

#include <mutex>
#include <string>

#include <fmt/core.h>

namespace transcode_watchdog {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

enum class LogLevel { Info, Warning, Error, Critical, Phase, Success };

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Write one already formatted line to the console and activity log.
 * @note Takes log_mutex; callers must not hold it.
 */
void write_log(LogLevel level, const std::string &message);

/**
 * @brief Start appending every log line to the given file.
 * @return false if the file could not be opened (console logging continues)
 */
bool open_activity_log(const std::string &path);

/// Stop writing to the activity log file.
void close_activity_log();

/// Level name as written to the activity log ("INFO", "WARNING", ...)
const char *level_name(LogLevel level);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define TW_LOG_AT(level, format_str, ...)                                      \
  do {                                                                         \
    transcode_watchdog::write_log(level,                                       \
                                  fmt::format(format_str, ##__VA_ARGS__));     \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  TW_LOG_AT(transcode_watchdog::LogLevel::Info, format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  TW_LOG_AT(transcode_watchdog::LogLevel::Warning, format_str, ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  TW_LOG_AT(transcode_watchdog::LogLevel::Error, format_str, ##__VA_ARGS__)
#define LOG_CRITICAL(format_str, ...)                                          \
  TW_LOG_AT(transcode_watchdog::LogLevel::Critical, format_str, ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  TW_LOG_AT(transcode_watchdog::LogLevel::Phase, format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  TW_LOG_AT(transcode_watchdog::LogLevel::Success, format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_CRITICAL(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_LOGGING_HPP
