/**
 * @file media_scanner.hpp
 * @brief Recursive media file enumeration
 */

#ifndef TRANSCODE_WATCHDOG_MEDIA_SCANNER_HPP
#define TRANSCODE_WATCHDOG_MEDIA_SCANNER_HPP

#include <string>
#include <vector>

namespace transcode_watchdog {

/**
 * @brief Case-insensitive check of a filename against an extension list.
 * @param extensions Lower-case extensions including the dot (".mkv")
 */
bool has_media_extension(const std::string &filename,
                         const std::vector<std::string> &extensions);

/**
 * @brief Keep the directories that exist, made absolute.
 * @note Each missing directory is logged as a warning.
 */
std::vector<std::string>
existing_directories(const std::vector<std::string> &directories);

/**
 * @brief Recursively collect media files under each directory.
 *
 * @note Directories are walked in the given order; files within one walk are
 *       returned sorted. Unreadable subdirectories are skipped with a warning.
 *
 * @return Absolute paths of matching regular files
 */
std::vector<std::string>
scan_media_files(const std::vector<std::string> &directories,
                 const std::vector<std::string> &extensions);

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_MEDIA_SCANNER_HPP
