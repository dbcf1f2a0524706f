/**
 * @file types.hpp
 * @brief Core data types and constants for Transcode Watchdog
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Policy constants (duration tolerance, GiB size)
 *
 *          - StreamInfo / MediaInfo for probed metadata
 *
 *          - InspectionVerdict for the Pass/Queue decision
 *
 *          - FailureKind for per-file failure classification
 */

#ifndef TRANSCODE_WATCHDOG_TYPES_HPP
#define TRANSCODE_WATCHDOG_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace transcode_watchdog {

// **----- CONSTANTS -----**

/// Bytes in one GiB, used for the size threshold
constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

/**
 * @brief Maximum allowed duration drift between original and candidate.
 * @note Container durations are rounded differently by muxers; one second
 *       absorbs that without hiding truncated encodes.
 */
constexpr double DURATION_TOLERANCE_SEC = 1.0;

/// Suffix appended to the basename of every encoded candidate
constexpr const char *CANDIDATE_SUFFIX = ".av1.mkv";

// **----- DATA STRUCTURES -----**

enum class StreamType { Video, Audio, Subtitle, Other };

/**
 * @struct StreamInfo
 * @brief One stream descriptor as reported by the prober.
 */
struct StreamInfo {
  StreamType type = StreamType::Other;
  std::string codec; //< Codec name (empty when unknown)
};

/**
 * @struct MediaInfo
 * @brief Probed metadata of a media file. Never persisted.
 */
struct MediaInfo {
  uint64_t size_bytes = 0;         //< Container size in bytes
  double duration_sec = 0.0;       //< Container duration in seconds
  std::vector<StreamInfo> streams; //< Streams in container order

  /// Codec of the first video stream, empty if there is none
  std::string video_codec() const;

  /// Number of streams of the given type
  int count(StreamType type) const;
};

enum class Verdict { Pass, Queue };

/**
 * @struct InspectionVerdict
 * @brief Result of inspecting one file.
 */
struct InspectionVerdict {
  Verdict verdict = Verdict::Queue;
  std::vector<std::string> reasons; //< Why the file was queued

  bool passed() const { return verdict == Verdict::Pass; }
};

/**
 * @brief Per-file failure classification.
 * @note ToolMissing only ever occurs at startup, never per file.
 */
enum class FailureKind {
  None,
  ToolMissing,
  ProbeFailure,
  CopyFailure,
  EncodeFailure,
  VerificationFailure,
  EfficiencyRejection,
  ReplaceFailure,
  UnhandledFailure
};

const char *to_string(StreamType type);
const char *to_string(Verdict verdict);
const char *to_string(FailureKind kind);

/// Map a prober codec_type tag ("video", "audio", ...) to a StreamType
StreamType stream_type_from_string(const std::string &tag);

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_TYPES_HPP
