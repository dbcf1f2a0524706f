/**
 * @file media_scanner.cpp
 * @brief Media enumeration implementation
 */

#include "transcode_watchdog/media_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "transcode_watchdog/logging.hpp"

namespace transcode_watchdog {

namespace fs = std::filesystem;

bool has_media_extension(const std::string &filename,
                         const std::vector<std::string> &extensions) {
  std::string lower = filename;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  for (const auto &ext : extensions) {
    if (lower.size() >= ext.size() &&
        lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
      return true;
    }
  }
  return false;
}

std::vector<std::string>
existing_directories(const std::vector<std::string> &directories) {
  std::vector<std::string> result;
  for (const auto &dir : directories) {
    std::error_code ec;
    fs::path abs = fs::absolute(dir, ec);
    if (ec || !fs::is_directory(abs, ec)) {
      LOG_WARN("Media directory not found, skipping: {}", abs.string());
      continue;
    }
    result.push_back(abs.lexically_normal().string());
  }
  return result;
}

std::vector<std::string>
scan_media_files(const std::vector<std::string> &directories,
                 const std::vector<std::string> &extensions) {
  std::vector<std::string> files;

  for (const auto &dir : directories) {
    std::vector<std::string> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(
        dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      LOG_WARN("Cannot scan {}: {}", dir, ec.message());
      continue;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
      std::error_code type_ec;
      if (it->is_regular_file(type_ec) &&
          has_media_extension(it->path().filename().string(), extensions)) {
        found.push_back(it->path().string());
      }
      it.increment(ec);
      if (ec) {
        LOG_WARN("Error while scanning {}: {}", dir, ec.message());
        break;
      }
    }

    std::sort(found.begin(), found.end());
    files.insert(files.end(), found.begin(), found.end());
  }
  return files;
}

} // namespace transcode_watchdog
