/**
 * @file events.cpp
 * @brief Event names and the logging sink
 */

#include "transcode_watchdog/events.hpp"

#include "transcode_watchdog/logging.hpp"

namespace transcode_watchdog {

const char *to_string(EventType type) {
  switch (type) {
  case EventType::Skipped:
    return "skipped";
  case EventType::Passed:
    return "passed";
  case EventType::Queued:
    return "queued";
  case EventType::CommandStarted:
    return "command_started";
  case EventType::CommandFailed:
    return "command_failed";
  case EventType::CopyFailed:
    return "copy_failed";
  case EventType::EncodeFailed:
    return "encode_failed";
  case EventType::HealthCheckFailed:
    return "health_check_failed";
  case EventType::ProbeFailed:
    return "probe_failed";
  case EventType::DurationMismatch:
    return "duration_mismatch";
  case EventType::StreamCountMismatch:
    return "stream_count_mismatch";
  case EventType::SubtitleCountChanged:
    return "subtitle_count_changed";
  case EventType::Verified:
    return "verified";
  case EventType::Discarded:
    return "discarded";
  case EventType::EfficiencyRejected:
    return "efficiency_rejected";
  case EventType::ReplaceStep:
    return "replace_step";
  case EventType::ReplaceFailed:
    return "replace_failed";
  case EventType::RolledBack:
    return "rolled_back";
  case EventType::OperatorAttention:
    return "operator_attention";
  case EventType::CleanupFailed:
    return "cleanup_failed";
  case EventType::Committed:
    return "committed";
  case EventType::Unhandled:
    return "unhandled";
  }
  return "unknown";
}

void LogEventSink::emit(const Event &event) {
  switch (event.severity) {
  case Severity::Info:
    if (event.type == EventType::Committed) {
      LOG_SUCCESS("{}", event.message);
    } else {
      LOG_INFO("{}", event.message);
    }
    break;
  case Severity::Warning:
    LOG_WARN("{}", event.message);
    break;
  case Severity::Error:
    LOG_ERROR("{}", event.message);
    break;
  case Severity::Critical:
    LOG_CRITICAL("{}", event.message);
    break;
  }
}

} // namespace transcode_watchdog
