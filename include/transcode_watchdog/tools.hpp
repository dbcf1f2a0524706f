/**
 * @file tools.hpp
 * @brief Capability interfaces for the external collaborators
 *
 * @details Every side effect the pipeline has on the outside world goes
 *          through one of these interfaces:
 *
 *          - MetadataProber: container/stream metadata and health probe
 *
 *          - Encoder: preset-driven re-encode
 *
 *          - Copier: content copy between local and durable storage
 *
 *          - FileSystem: rename/exchange/remove primitives for the replacer
 *
 * @note Real implementations live in external_tools.hpp, ffprobe_prober.hpp
 *       and libav_prober.hpp. Tests supply deterministic fakes.
 */

#ifndef TRANSCODE_WATCHDOG_TOOLS_HPP
#define TRANSCODE_WATCHDOG_TOOLS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "types.hpp"

namespace transcode_watchdog {

/**
 * @class MetadataProber
 * @brief Reports size, duration and streams of a media file.
 */
class MetadataProber {
public:
  virtual ~MetadataProber() = default;

  /**
   * @brief Probe a file.
   * @return Metadata, or std::nullopt if the tool failed or its output could
   *         not be parsed
   */
  virtual std::optional<MediaInfo> probe(const std::string &path) = 0;

  /**
   * @brief Cheap integrity probe of a single file.
   * @return true if the file opens cleanly
   */
  virtual bool health_check(const std::string &path) = 0;
};

/**
 * @class Encoder
 * @brief Re-encodes a file with a named preset.
 */
class Encoder {
public:
  virtual ~Encoder() = default;

  /// @return Process exit status (0 = success)
  virtual int encode(const std::string &preset_file,
                     const std::string &preset_name,
                     const std::string &input_path,
                     const std::string &output_path) = 0;
};

/**
 * @class Copier
 * @brief Copies file content. Destination state after a failure is
 *        unspecified.
 */
class Copier {
public:
  virtual ~Copier() = default;

  /// @return Process exit status (0 = success)
  virtual int copy(const std::string &source, const std::string &destination) = 0;
};

/**
 * @class FileSystem
 * @brief Filesystem primitives used by the pipeline.
 */
class FileSystem {
public:
  virtual ~FileSystem() = default;

  virtual bool exists(const std::string &path) = 0;

  /// @return Size in bytes, or std::nullopt if the file cannot be stat'ed
  virtual std::optional<uint64_t> file_size(const std::string &path) = 0;

  /// rename(2) semantics: atomic within one filesystem
  virtual std::error_code rename(const std::string &from,
                                 const std::string &to) = 0;

  /**
   * @brief Atomically swap two existing paths.
   * @return std::errc::operation_not_supported if the platform or
   *         filesystem has no exchange primitive
   */
  virtual std::error_code exchange(const std::string &a,
                                   const std::string &b) = 0;

  /// Removing a path that does not exist is not an error
  virtual std::error_code remove(const std::string &path) = 0;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_TOOLS_HPP
