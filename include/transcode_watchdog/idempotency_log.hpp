/**
 * @file idempotency_log.hpp
 * @brief Durable append-only record of handled paths
 *
 * @details On disk: UTF-8 text, one absolute path per line. In memory: a set
 *          for membership tests.
 *
 * @attention INVARIANTS:
 *
 * - Lines are only ever appended; nothing is removed or rewritten
 *
 * - Writes do not deduplicate; readers treat the file as a set
 *
 * - Presence means "do not inspect this path again", not "the file still
 *   satisfies policy": content changed out-of-band is not re-detected
 *
 * - Not safe for two processes to share; the deployment runs one instance
 */

#ifndef TRANSCODE_WATCHDOG_IDEMPOTENCY_LOG_HPP
#define TRANSCODE_WATCHDOG_IDEMPOTENCY_LOG_HPP

#include <string>
#include <system_error>
#include <unordered_set>

namespace transcode_watchdog {

class IdempotencyLog {
public:
  /**
   * @brief Bind to a log file and load its current contents.
   * @note A missing file is an empty log; it is created on first append.
   */
  explicit IdempotencyLog(std::string path);

  /// True if the path has been recorded (by this or an earlier run)
  bool contains(const std::string &path) const;

  /**
   * @brief Durably record a path.
   *
   * @note The line is written with a single O_APPEND write and fsync'd
   *       before returning, so a crash right after does not lose it. The
   *       in-memory set is updated even if the write fails.
   *
   * @return Empty error code on success
   */
  std::error_code append(const std::string &path);

  size_t size() const { return entries_.size(); }
  const std::string &path() const { return path_; }

private:
  std::string path_;
  std::unordered_set<std::string> entries_;

  void load();
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_IDEMPOTENCY_LOG_HPP
