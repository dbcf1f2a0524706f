/**
 * @file logging.cpp
 * @brief Logging implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - Colored console output per level
 *
 *          - Timestamped activity log file
 */

#include "transcode_watchdog/logging.hpp"

#include <cstdio>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>

namespace transcode_watchdog {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

namespace {

/// Activity log handle, guarded by log_mutex
std::FILE *activity_file = nullptr;

void print_console(LogLevel level, const std::string &message) {
  switch (level) {
  case LogLevel::Info:
    fmt::print("[INFO] {}\n", message);
    break;
  case LogLevel::Warning:
    fmt::print(fg(fmt::color::yellow), "[WARN] {}\n", message);
    break;
  case LogLevel::Error:
    fmt::print(fg(fmt::color::red), "[ERROR] {}\n", message);
    break;
  case LogLevel::Critical:
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "[CRITICAL] {}\n",
               message);
    break;
  case LogLevel::Phase:
    fmt::print(fg(fmt::color::cyan), "{}\n", message);
    break;
  case LogLevel::Success:
    fmt::print(fg(fmt::color::green), "{}\n", message);
    break;
  }
  std::fflush(stdout);
}

} // anonymous namespace

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Critical:
    return "CRITICAL";
  case LogLevel::Info:
  case LogLevel::Phase:
  case LogLevel::Success:
    break;
  }
  return "INFO";
}

void write_log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  print_console(level, message);

  if (activity_file) {
    std::time_t now = std::time(nullptr);
    fmt::print(activity_file, "{:%Y-%m-%d %H:%M:%S} | {} | {}\n",
               fmt::localtime(now), level_name(level), message);
    std::fflush(activity_file);
  }
}

bool open_activity_log(const std::string &path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (activity_file) {
    std::fclose(activity_file);
    activity_file = nullptr;
  }
  activity_file = std::fopen(path.c_str(), "a");
  return activity_file != nullptr;
}

void close_activity_log() {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (activity_file) {
    std::fclose(activity_file);
    activity_file = nullptr;
  }
}

} // namespace transcode_watchdog
