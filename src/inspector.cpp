/**
 * @file inspector.cpp
 * @brief Inspector implementation
 */

#include "transcode_watchdog/inspector.hpp"

#include <cmath>

#include <fmt/format.h>

namespace transcode_watchdog {

uint64_t size_limit_bytes(double max_size_gb) {
  if (max_size_gb <= 0.0)
    return 0;
  return static_cast<uint64_t>(std::floor(max_size_gb * BYTES_PER_GB));
}

InspectionVerdict Inspector::inspect(const std::string &path) {
  InspectionVerdict result;

  auto info = ctx_.prober.probe(path);
  if (!info) {
    result.verdict = Verdict::Queue;
    result.reasons.push_back("metadata unavailable");
    ctx_.events.info(EventType::Queued, path,
                     fmt::format("Inspection failed to read metadata; "
                                 "queueing for transcode: {}",
                                 path));
    return result;
  }

  const WatchdogConfig &config = ctx_.config;
  std::string codec = info->video_codec();
  uint64_t limit = size_limit_bytes(config.max_size_gb);

  bool codec_ok = !codec.empty() && codec == config.target_codec;
  bool size_ok = info->size_bytes < limit;

  if (codec_ok && size_ok) {
    result.verdict = Verdict::Pass;
    ctx_.events.info(EventType::Passed, path,
                     fmt::format("PASS: {} (codec={}, size={} < {})", path,
                                 codec, info->size_bytes, limit));

    if (auto ec = log_.append(path)) {
      ctx_.events.error(EventType::Passed, path,
                        fmt::format("Could not record {} in {}: {}", path,
                                    log_.path(), ec.message()));
    }
    return result;
  }

  result.verdict = Verdict::Queue;
  if (!codec_ok)
    result.reasons.push_back(
        fmt::format("codec is {}", codec.empty() ? "none" : codec));
  if (!size_ok)
    result.reasons.push_back("file size exceeds limit");
  if (result.reasons.empty())
    result.reasons.push_back("unknown");

  ctx_.events.info(EventType::Queued, path,
                   fmt::format("QUEUE: {} (reasons: {})", path,
                               fmt::join(result.reasons, ", ")));
  return result;
}

} // namespace transcode_watchdog
