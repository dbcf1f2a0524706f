/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Home-directory expansion and path resolution
 *
 *          - PATH lookup with access(2)
 *
 *          - Time and size formatting utilities
 */

#include "transcode_watchdog/system.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

#include <unistd.h>

#include <fmt/core.h>

namespace transcode_watchdog {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Regular file with execute permission for this process
bool is_executable_file(const std::string &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return false;
  return access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

// **---- Paths ----**

std::string expand_user(const std::string &path) {
  if (path.empty() || path[0] != '~')
    return path;
  if (path.size() > 1 && path[1] != '/')
    return path;

  const char *home = std::getenv("HOME");
  if (!home || *home == '\0')
    return path;
  return std::string(home) + path.substr(1);
}

std::string resolve_path(const std::string &base_dir,
                         const std::string &path) {
  fs::path p(expand_user(path));
  if (p.is_absolute())
    return p.string();
  return (fs::path(base_dir) / p).string();
}

// **---- Tool Discovery ----**

std::string find_executable(const std::string &name) {
  if (name.empty())
    return {};

  if (name.find('/') != std::string::npos) {
    return is_executable_file(name) ? name : std::string{};
  }

  const char *path_env = std::getenv("PATH");
  std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  size_t pos = 0;
  while (pos <= search.size()) {
    size_t end = search.find(':', pos);
    if (end == std::string::npos)
      end = search.size();

    /// An empty PATH entry means the current directory
    std::string dir = search.substr(pos, end - pos);
    if (dir.empty())
      dir = ".";

    std::string candidate = (fs::path(dir) / name).string();
    if (is_executable_file(candidate))
      return candidate;

    pos = end + 1;
  }
  return {};
}

std::vector<std::string> missing_tools(const std::vector<std::string> &tools) {
  std::vector<std::string> missing;
  for (const auto &tool : tools) {
    if (find_executable(tool).empty())
      missing.push_back(tool);
  }
  return missing;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_bytes(uint64_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0)
    return fmt::format("{} B", bytes);
  return fmt::format("{:.2f} {}", value, units[unit]);
}

} // namespace transcode_watchdog
