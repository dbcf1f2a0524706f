/**
 * @file system.hpp
 * @brief System utilities: path handling, PATH lookup and formatting
 *
 * @details Provides:
 *
 *          - Home-directory expansion and base-relative path resolution
 *
 *          - Executable discovery on PATH for the startup tool check
 *
 *          - Time and size formatting utilities
 */

#ifndef TRANSCODE_WATCHDOG_SYSTEM_HPP
#define TRANSCODE_WATCHDOG_SYSTEM_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace transcode_watchdog {

// **---- Paths ----**

/**
 * @brief Expand a leading "~" or "~/" using $HOME.
 * @note Other forms ("~user") are returned unchanged.
 */
std::string expand_user(const std::string &path);

/**
 * @brief Resolve a path against a base directory.
 * @return path unchanged if absolute, otherwise base_dir / path
 */
std::string resolve_path(const std::string &base_dir, const std::string &path);

// **---- Tool Discovery ----**

/**
 * @brief Locate an executable the way a shell would.
 *
 * @note Names containing '/' are checked directly; otherwise each PATH entry
 *       is searched for a regular file with execute permission.
 *
 * @return Full path, or an empty string if not found
 */
std::string find_executable(const std::string &name);

/**
 * @brief Return the subset of tools that cannot be found on PATH.
 */
std::vector<std::string> missing_tools(const std::vector<std::string> &tools);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a byte count with a binary unit (B, KiB, MiB, GiB).
 */
std::string format_bytes(uint64_t bytes);

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_SYSTEM_HPP
