/**
 * @file verifier.cpp
 * @brief Verifier implementation
 */

#include "transcode_watchdog/verifier.hpp"

#include <cmath>

#include <fmt/core.h>

namespace transcode_watchdog {

StreamCounts StreamCounts::of(const MediaInfo &info) {
  StreamCounts c;
  c.video = info.count(StreamType::Video);
  c.audio = info.count(StreamType::Audio);
  c.subtitle = info.count(StreamType::Subtitle);
  return c;
}

VerificationReport compare_media(const MediaInfo &source,
                                 const MediaInfo &candidate) {
  VerificationReport report;
  report.source_duration = source.duration_sec;
  report.candidate_duration = candidate.duration_sec;
  report.duration_delta = std::fabs(source.duration_sec - candidate.duration_sec);
  report.source = StreamCounts::of(source);
  report.candidate = StreamCounts::of(candidate);
  report.subtitle_delta = report.candidate.subtitle - report.source.subtitle;

  if (report.duration_delta > DURATION_TOLERANCE_SEC) {
    report.status = VerifyStatus::DurationMismatch;
  } else if (report.source.video != report.candidate.video ||
             report.source.audio != report.candidate.audio) {
    report.status = VerifyStatus::StreamCountMismatch;
  } else {
    report.status = VerifyStatus::Passed;
  }
  return report;
}

VerificationReport Verifier::verify(const std::string &local_original,
                                    const std::string &candidate) {
  VerificationReport report;

  if (!ctx_.prober.health_check(candidate)) {
    report.status = VerifyStatus::HealthCheckFailed;
    ctx_.events.error(EventType::HealthCheckFailed, candidate,
                      fmt::format("Health check failed for {}", candidate));
    return report;
  }

  auto orig = ctx_.prober.probe(local_original);
  auto cand = ctx_.prober.probe(candidate);
  if (!orig || !cand) {
    report.status = VerifyStatus::MetadataUnavailable;
    ctx_.events.error(EventType::ProbeFailed, candidate,
                      "Failed to read metadata for verification");
    return report;
  }

  report = compare_media(*orig, *cand);

  switch (report.status) {
  case VerifyStatus::DurationMismatch:
    ctx_.events.error(EventType::DurationMismatch, candidate,
                      fmt::format("Duration mismatch: original={:.3f}s new={:.3f}s",
                                  report.source_duration,
                                  report.candidate_duration));
    return report;
  case VerifyStatus::StreamCountMismatch:
    ctx_.events.error(
        EventType::StreamCountMismatch, candidate,
        fmt::format("Stream count mismatch (video/audio): orig(v{},a{}) vs "
                    "new(v{},a{})",
                    report.source.video, report.source.audio,
                    report.candidate.video, report.candidate.audio));
    return report;
  default:
    break;
  }

  if (report.subtitle_delta != 0) {
    ctx_.events.info(EventType::SubtitleCountChanged, candidate,
                     fmt::format("Subtitle track count changed: orig s{} -> "
                                 "new s{} (allowed)",
                                 report.source.subtitle,
                                 report.candidate.subtitle));
  }
  ctx_.events.info(EventType::Verified, candidate,
                   fmt::format("Verified {} (duration delta {:.3f}s)",
                               candidate, report.duration_delta));
  return report;
}

} // namespace transcode_watchdog
