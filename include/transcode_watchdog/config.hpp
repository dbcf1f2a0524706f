/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides the get_env_* helpers and WatchdogConfig, the policy and
 *          path settings read once at startup. See
 *          config/transcode_watchdog.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef TRANSCODE_WATCHDOG_CONFIG_HPP
#define TRANSCODE_WATCHDOG_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace transcode_watchdog {

/**
 * @class ConfigError
 * @brief Raised when an environment variable holds an unusable value.
 */
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

namespace Config {

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 */
std::string get_env_string(const char *name, const std::string &default_val);

/**
 * @brief Get a double value from environment variable.
 * @throws ConfigError if the value is not a number
 */
double get_env_double(const char *name, double default_val);

/**
 * @brief Get an integer value from environment variable.
 * @throws ConfigError if the value is not an integer
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a list from environment variable.
 * @param separator Character between entries; empty entries are dropped
 */
std::vector<std::string> get_env_list(const char *name, char separator,
                                      const std::vector<std::string> &default_val);

} // namespace Config

enum class ProbeBackend { Ffprobe, Libav };

/**
 * @struct WatchdogConfig
 * @brief Policy and paths for one run. Not re-read during a run.
 */
struct WatchdogConfig {
  std::vector<std::string> media_directories{"~/jellyfin_test/movies"};
  std::string temp_dir = "/tmp/transcoding/";
  std::string preset_file = "AV1_MKV_Stereo.json";
  std::string preset_name = "AV1_MKV_Stereo";
  std::string inspected_log = "inspected_files.log";
  std::string activity_log = "activity.log";
  double max_size_gb = 0.005;
  std::string target_codec = "av1";
  std::vector<std::string> extensions{".mkv", ".mp4", ".avi", ".mov",
                                      ".webm"};
  ProbeBackend probe_backend = ProbeBackend::Ffprobe;
  bool atomic_exchange = true; //< Prefer renameat2(RENAME_EXCHANGE)
};

/**
 * @brief Build the configuration from the environment.
 *
 * @note Relative preset/log paths are resolved against WATCHDOG_BASE_DIR
 *       (default: current directory); directories are ~-expanded.
 * @throws ConfigError on unparseable values
 */
WatchdogConfig load_config();

/// External tools the configuration needs on PATH
std::vector<std::string> required_tools(const WatchdogConfig &config);

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_CONFIG_HPP
