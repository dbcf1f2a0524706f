/**
 * @file events.hpp
 * @brief Structured pipeline events and sinks
 *
 * @details Pipeline stages report what they did as Event values sent to an
 *          EventSink held by the RunContext, instead of writing to the log
 *          directly:
 *
 *          - LogEventSink forwards events to the logging macros (console and
 *            activity log)
 *
 *          - Tests install a recording sink and assert on the events
 */

#ifndef TRANSCODE_WATCHDOG_EVENTS_HPP
#define TRANSCODE_WATCHDOG_EVENTS_HPP

#include <string>

namespace transcode_watchdog {

enum class Severity { Info, Warning, Error, Critical };

enum class EventType {
  Skipped,              //< Path already in the inspected log
  Passed,               //< Inspector verdict PASS
  Queued,               //< Inspector verdict QUEUE
  CommandStarted,       //< External command about to run
  CommandFailed,        //< External command exited non-zero
  CopyFailed,           //< Staging copy failed
  EncodeFailed,         //< Encoder failed or produced no output
  HealthCheckFailed,    //< Candidate failed the cheap health probe
  ProbeFailed,          //< Metadata unavailable during verification
  DurationMismatch,     //< Durations differ by more than the tolerance
  StreamCountMismatch,  //< Video/audio stream counts differ
  SubtitleCountChanged, //< Subtitle count differs (tolerated, audited)
  Verified,             //< Candidate passed verification
  Discarded,            //< Candidate deleted without replacing
  EfficiencyRejected,   //< Candidate not smaller than original
  ReplaceStep,          //< Replace transaction advanced a state
  ReplaceFailed,        //< Replace transaction failed
  RolledBack,           //< Replace transaction restored the original
  OperatorAttention,    //< Original path could not be restored
  CleanupFailed,        //< Leftover file could not be deleted
  Committed,            //< New content published and logged
  Unhandled             //< Unexpected fault caught at the per-file boundary
};

const char *to_string(EventType type);

/**
 * @struct Event
 * @brief One structured pipeline event.
 */
struct Event {
  Severity severity = Severity::Info;
  EventType type = EventType::CommandStarted;
  std::string path;    //< File the event concerns (may be empty)
  std::string message; //< Human-readable description
};

/**
 * @class EventSink
 * @brief Receiver of pipeline events.
 */
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void emit(const Event &event) = 0;

  void info(EventType type, const std::string &path, const std::string &msg) {
    emit({Severity::Info, type, path, msg});
  }
  void warning(EventType type, const std::string &path,
               const std::string &msg) {
    emit({Severity::Warning, type, path, msg});
  }
  void error(EventType type, const std::string &path, const std::string &msg) {
    emit({Severity::Error, type, path, msg});
  }
  void critical(EventType type, const std::string &path,
                const std::string &msg) {
    emit({Severity::Critical, type, path, msg});
  }
};

/**
 * @class LogEventSink
 * @brief Writes events through the logging macros.
 */
class LogEventSink : public EventSink {
public:
  void emit(const Event &event) override;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_EVENTS_HPP
