/**
 * @file types.cpp
 * @brief MediaInfo helpers and enum names
 */

#include "transcode_watchdog/types.hpp"

#include <algorithm>

namespace transcode_watchdog {

std::string MediaInfo::video_codec() const {
  for (const auto &s : streams) {
    if (s.type == StreamType::Video)
      return s.codec;
  }
  return {};
}

int MediaInfo::count(StreamType type) const {
  return static_cast<int>(
      std::count_if(streams.begin(), streams.end(),
                    [type](const StreamInfo &s) { return s.type == type; }));
}

const char *to_string(StreamType type) {
  switch (type) {
  case StreamType::Video:
    return "video";
  case StreamType::Audio:
    return "audio";
  case StreamType::Subtitle:
    return "subtitle";
  case StreamType::Other:
    break;
  }
  return "other";
}

const char *to_string(Verdict verdict) {
  return verdict == Verdict::Pass ? "PASS" : "QUEUE";
}

const char *to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::None:
    return "none";
  case FailureKind::ToolMissing:
    return "tool missing";
  case FailureKind::ProbeFailure:
    return "probe failure";
  case FailureKind::CopyFailure:
    return "copy failure";
  case FailureKind::EncodeFailure:
    return "encode failure";
  case FailureKind::VerificationFailure:
    return "verification failure";
  case FailureKind::EfficiencyRejection:
    return "efficiency rejection";
  case FailureKind::ReplaceFailure:
    return "replace failure";
  case FailureKind::UnhandledFailure:
    return "unhandled failure";
  }
  return "unknown";
}

StreamType stream_type_from_string(const std::string &tag) {
  if (tag == "video")
    return StreamType::Video;
  if (tag == "audio")
    return StreamType::Audio;
  if (tag == "subtitle")
    return StreamType::Subtitle;
  return StreamType::Other;
}

} // namespace transcode_watchdog
