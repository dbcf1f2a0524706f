/**
 * @file replacer.hpp
 * @brief Publish a verified candidate at the original's durable path
 *
 * @details Three path names are derived from the original:
 *          `<name>`, `<name>.tmp` and `<name>.old`, all in the original's
 *          directory so every rename stays within one filesystem.
 *
 * @attention STATE MACHINE:
 *
 * 1. Pending -> TempWritten: copy candidate to `<name>.tmp`
 *
 * 2. TempWritten -> Swapped: rename `<name>` to `<name>.old`
 *
 * 3. Swapped -> Committed: rename `<name>.tmp` to `<name>`
 *
 * 4. Committed: delete `<name>.old` (failure is non-fatal)
 *
 * A failure in step 3 rolls back: `<name>.old` is renamed back to `<name>`
 * (or, if it is gone, `<name>.tmp` is published instead) and the `.tmp` is
 * removed. If `<name>` still does not exist afterwards the transaction ends
 * in Failed and an OperatorAttention event is emitted.
 *
 * @note Between steps 2 and 3 `<name>` briefly does not exist; a concurrent
 *       reader can observe that. When the filesystem supports
 *       renameat2(RENAME_EXCHANGE) and exchange mode is enabled, steps 2 and 3
 *       are one atomic exchange and the window disappears; the previous
 *       content then sits at `<name>.tmp` and is deleted in step 4.
 */

#ifndef TRANSCODE_WATCHDOG_REPLACER_HPP
#define TRANSCODE_WATCHDOG_REPLACER_HPP

#include <string>

#include "context.hpp"
#include "types.hpp"

namespace transcode_watchdog {

enum class ReplaceState {
  Pending,
  TempWritten,
  Swapped,
  Committed,
  RolledBack,
  Failed
};

const char *to_string(ReplaceState state);

/**
 * @struct ReplacePaths
 * @brief The three names a transaction operates on.
 */
struct ReplacePaths {
  std::string original;
  std::string temp; //< <name>.tmp
  std::string old;  //< <name>.old

  static ReplacePaths for_original(const std::string &original);
};

/**
 * @struct ReplaceResult
 * @brief Final state of one transaction.
 */
struct ReplaceResult {
  ReplaceState state = ReplaceState::Pending;
  bool exchanged = false; //< Published with one atomic exchange
  std::string detail;     //< Failure description, empty on success

  bool ok() const { return state == ReplaceState::Committed; }
};

class Replacer {
public:
  explicit Replacer(RunContext &ctx) : ctx_(ctx) {}

  /**
   * @brief Replace original_path with the content of candidate_path.
   * @return Committed on success; RolledBack or Failed otherwise
   */
  ReplaceResult replace(const std::string &original_path,
                        const std::string &candidate_path);

private:
  RunContext &ctx_;

  /// Move the transaction to a new state and report it
  void advance(ReplaceResult &result, const ReplacePaths &paths,
               ReplaceState next);

  /// Best-effort removal of a leftover transaction file
  void discard(const ReplacePaths &paths, const std::string &path);

  /// Restore the original path after a failed publish
  void roll_back(ReplaceResult &result, const ReplacePaths &paths);

  /// Fail the transaction before the original was moved
  ReplaceResult &abort(ReplaceResult &result, const ReplacePaths &paths,
                       std::string detail);
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_REPLACER_HPP
