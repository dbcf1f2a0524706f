/**
 * @file inspector.hpp
 * @brief Pass/Queue decision against the encoding policy
 *
 * @details A file passes when its first video stream already uses the
 *          target codec AND its container is smaller than the size limit.
 *          A file in the target codec that is too large is still queued.
 *          Probe failures queue the file (fail open): nothing is skipped
 *          silently.
 */

#ifndef TRANSCODE_WATCHDOG_INSPECTOR_HPP
#define TRANSCODE_WATCHDOG_INSPECTOR_HPP

#include <cstdint>
#include <string>

#include "context.hpp"
#include "idempotency_log.hpp"
#include "types.hpp"

namespace transcode_watchdog {

/**
 * @brief Size threshold in bytes: floor(max_size_gb * 1024^3).
 * @note Truncates, so 0.005 GB is 5368709 bytes.
 */
uint64_t size_limit_bytes(double max_size_gb);

class Inspector {
public:
  Inspector(RunContext &ctx, IdempotencyLog &log) : ctx_(ctx), log_(log) {}

  /**
   * @brief Inspect one file.
   * @note On Pass the path is appended to the idempotency log before
   *       returning.
   */
  InspectionVerdict inspect(const std::string &path);

private:
  RunContext &ctx_;
  IdempotencyLog &log_;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_INSPECTOR_HPP
