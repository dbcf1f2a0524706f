/**
 * @file config.cpp
 * @brief Environment-based configuration loading
 */

#include "transcode_watchdog/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

#include <fmt/core.h>

#include "transcode_watchdog/system.hpp"

namespace transcode_watchdog {

namespace Config {

std::string get_env_string(const char *name, const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  size_t used = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(val, &used);
  } catch (const std::exception &) {
    throw ConfigError(fmt::format("{} is not a number: '{}'", name, val));
  }
  if (val[used] != '\0')
    throw ConfigError(fmt::format("{} is not a number: '{}'", name, val));
  return parsed;
}

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  size_t used = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(val, &used);
  } catch (const std::exception &) {
    throw ConfigError(fmt::format("{} is not an integer: '{}'", name, val));
  }
  if (val[used] != '\0')
    throw ConfigError(fmt::format("{} is not an integer: '{}'", name, val));
  return parsed;
}

std::vector<std::string> get_env_list(const char *name, char separator,
                                      const std::vector<std::string> &default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  std::vector<std::string> items;
  std::string line(val);
  size_t pos = 0;
  while (pos <= line.size()) {
    size_t end = line.find(separator, pos);
    if (end == std::string::npos)
      end = line.size();

    std::string item = line.substr(pos, end - pos);
    auto first = item.find_first_not_of(" \t");
    auto last = item.find_last_not_of(" \t");
    if (first != std::string::npos)
      items.push_back(item.substr(first, last - first + 1));

    pos = end + 1;
  }
  return items;
}

} // namespace Config

// **---- Loading ----**

WatchdogConfig load_config() {
  WatchdogConfig config;

  std::string base_dir = Config::get_env_string(
      "WATCHDOG_BASE_DIR", std::filesystem::current_path().string());
  base_dir = expand_user(base_dir);

  config.media_directories = Config::get_env_list(
      "MEDIA_DIRECTORIES", ':', config.media_directories);
  for (auto &dir : config.media_directories)
    dir = expand_user(dir);

  config.temp_dir =
      expand_user(Config::get_env_string("TRANSCODE_TEMP_PATH", config.temp_dir));
  config.preset_file = resolve_path(
      base_dir, Config::get_env_string("HANDBRAKE_PRESET_FILE", config.preset_file));
  config.preset_name =
      Config::get_env_string("HANDBRAKE_PRESET_NAME", config.preset_name);
  config.inspected_log = resolve_path(
      base_dir, Config::get_env_string("INSPECTED_FILES_LOG", config.inspected_log));
  config.activity_log = resolve_path(
      base_dir, Config::get_env_string("ACTIVITY_LOG", config.activity_log));

  config.max_size_gb = Config::get_env_double("MAX_FILE_SIZE_GB", config.max_size_gb);
  if (config.max_size_gb < 0.0)
    throw ConfigError("MAX_FILE_SIZE_GB must not be negative");

  config.target_codec = Config::get_env_string("TARGET_CODEC", config.target_codec);

  config.extensions =
      Config::get_env_list("VIDEO_EXTENSIONS", ',', config.extensions);
  for (auto &ext : config.extensions) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (!ext.empty() && ext[0] != '.')
      ext.insert(ext.begin(), '.');
  }

  std::string backend = Config::get_env_string("PROBE_BACKEND", "ffprobe");
  if (backend == "ffprobe") {
    config.probe_backend = ProbeBackend::Ffprobe;
  } else if (backend == "libav") {
    config.probe_backend = ProbeBackend::Libav;
  } else {
    throw ConfigError(fmt::format(
        "PROBE_BACKEND must be 'ffprobe' or 'libav', got '{}'", backend));
  }

  config.atomic_exchange = Config::get_env_int("ATOMIC_EXCHANGE", 1) != 0;

  return config;
}

std::vector<std::string> required_tools(const WatchdogConfig &config) {
  std::vector<std::string> tools;
  if (config.probe_backend == ProbeBackend::Ffprobe)
    tools.push_back("ffprobe");
  tools.push_back("HandBrakeCLI");
  tools.push_back("rsync");
  return tools;
}

} // namespace transcode_watchdog
