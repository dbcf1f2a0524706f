/**
 * @file verifier.hpp
 * @brief Candidate verification and the efficiency gate
 *
 * @details Verification, in order:
 *
 *          1. Health probe of the candidate alone (fail = corrupt)
 *
 *          2. Full probe of both files (either unreadable = fail)
 *
 *          3. |duration delta| must not exceed DURATION_TOLERANCE_SEC
 *
 *          4. (video, audio) stream counts must match exactly
 *
 *          A subtitle count change alone passes, but is emitted as a
 *          SubtitleCountChanged event for audit.
 */

#ifndef TRANSCODE_WATCHDOG_VERIFIER_HPP
#define TRANSCODE_WATCHDOG_VERIFIER_HPP

#include <cstdint>
#include <string>

#include "context.hpp"
#include "types.hpp"

namespace transcode_watchdog {

/**
 * @struct StreamCounts
 * @brief Per-type stream counts of one file.
 */
struct StreamCounts {
  int video = 0;
  int audio = 0;
  int subtitle = 0;

  static StreamCounts of(const MediaInfo &info);
};

enum class VerifyStatus {
  Passed,
  HealthCheckFailed,
  MetadataUnavailable,
  DurationMismatch,
  StreamCountMismatch
};

/**
 * @struct VerificationReport
 * @brief Comparison of original and candidate. Not persisted.
 */
struct VerificationReport {
  VerifyStatus status = VerifyStatus::MetadataUnavailable;
  double source_duration = 0.0;
  double candidate_duration = 0.0;
  double duration_delta = 0.0; //< |source - candidate| in seconds
  StreamCounts source;
  StreamCounts candidate;
  int subtitle_delta = 0; //< candidate - source subtitle count

  bool passed() const { return status == VerifyStatus::Passed; }
};

/**
 * @brief Apply the duration and stream-count rules to two probe results.
 * @note Pure; used by Verifier::verify after probing.
 */
VerificationReport compare_media(const MediaInfo &source,
                                 const MediaInfo &candidate);

class Verifier {
public:
  explicit Verifier(RunContext &ctx) : ctx_(ctx) {}

  /**
   * @brief Verify a candidate against the local copy of its original.
   * @return Full report; report.passed() is the verdict
   */
  VerificationReport verify(const std::string &local_original,
                            const std::string &candidate);

private:
  RunContext &ctx_;
};

/**
 * @brief Efficiency gate: accept only a strictly smaller candidate.
 * @note Equal sizes are rejected.
 */
inline bool is_efficient(uint64_t original_size_bytes,
                         uint64_t candidate_size_bytes) {
  return candidate_size_bytes < original_size_bytes;
}

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_VERIFIER_HPP
