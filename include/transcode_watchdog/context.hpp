/**
 * @file context.hpp
 * @brief Execution context passed to every pipeline stage
 */

#ifndef TRANSCODE_WATCHDOG_CONTEXT_HPP
#define TRANSCODE_WATCHDOG_CONTEXT_HPP

#include "config.hpp"
#include "events.hpp"
#include "tools.hpp"

namespace transcode_watchdog {

/**
 * @struct RunContext
 * @brief Configuration, capabilities and event sink for one run.
 * @note Non-owning; everything referenced must outlive the run.
 */
struct RunContext {
  const WatchdogConfig &config;
  EventSink &events;
  MetadataProber &prober;
  Encoder &encoder;
  Copier &copier;
  FileSystem &fs;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_CONTEXT_HPP
