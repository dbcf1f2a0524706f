/**
 * @file replacer.cpp
 * @brief Replace transaction implementation
 */

#include "transcode_watchdog/replacer.hpp"

#include <fmt/core.h>

namespace transcode_watchdog {

const char *to_string(ReplaceState state) {
  switch (state) {
  case ReplaceState::Pending:
    return "Pending";
  case ReplaceState::TempWritten:
    return "TempWritten";
  case ReplaceState::Swapped:
    return "Swapped";
  case ReplaceState::Committed:
    return "Committed";
  case ReplaceState::RolledBack:
    return "RolledBack";
  case ReplaceState::Failed:
    return "Failed";
  }
  return "Unknown";
}

ReplacePaths ReplacePaths::for_original(const std::string &original) {
  return {original, original + ".tmp", original + ".old"};
}

// **---- Helpers ----**

void Replacer::advance(ReplaceResult &result, const ReplacePaths &paths,
                       ReplaceState next) {
  ctx_.events.info(EventType::ReplaceStep, paths.original,
                   fmt::format("Replace {}: {} -> {}", paths.original,
                               to_string(result.state), to_string(next)));
  result.state = next;
}

void Replacer::discard(const ReplacePaths &paths, const std::string &path) {
  if (!ctx_.fs.exists(path))
    return;
  if (auto ec = ctx_.fs.remove(path)) {
    ctx_.events.warning(EventType::CleanupFailed, paths.original,
                        fmt::format("Could not delete {}: {}", path,
                                    ec.message()));
  }
}

ReplaceResult &Replacer::abort(ReplaceResult &result, const ReplacePaths &paths,
                               std::string detail) {
  result.detail = std::move(detail);
  result.state = ReplaceState::Failed;
  ctx_.events.critical(EventType::ReplaceFailed, paths.original,
                       fmt::format("Safe replace failed: {}", result.detail));
  discard(paths, paths.temp);
  return result;
}

void Replacer::roll_back(ReplaceResult &result, const ReplacePaths &paths) {
  FileSystem &fs = ctx_.fs;

  if (!fs.exists(paths.original) && fs.exists(paths.old)) {
    if (auto ec = fs.rename(paths.old, paths.original)) {
      ctx_.events.critical(EventType::ReplaceFailed, paths.original,
                           fmt::format("Rollback rename {} -> {} failed: {}",
                                       paths.old, paths.original,
                                       ec.message()));
    }
  }

  /// Without the previous content, publishing the candidate still beats an
  /// empty path
  if (!fs.exists(paths.original) && fs.exists(paths.temp)) {
    if (auto ec = fs.rename(paths.temp, paths.original)) {
      ctx_.events.critical(EventType::ReplaceFailed, paths.original,
                           fmt::format("Rollback rename {} -> {} failed: {}",
                                       paths.temp, paths.original,
                                       ec.message()));
    }
  }

  if (fs.exists(paths.original)) {
    discard(paths, paths.temp);
    result.state = ReplaceState::RolledBack;
    ctx_.events.warning(EventType::RolledBack, paths.original,
                        fmt::format("Rolled back replace of {}", paths.original));
    return;
  }

  result.state = ReplaceState::Failed;
  ctx_.events.critical(
      EventType::OperatorAttention, paths.original,
      fmt::format("OPERATOR ATTENTION: {} is missing after a failed replace; "
                  "previous content may be at {} and the new content at {}",
                  paths.original, paths.old, paths.temp));
}

// **---- Transaction ----**

ReplaceResult Replacer::replace(const std::string &original_path,
                                const std::string &candidate_path) {
  ReplaceResult result;
  const ReplacePaths paths = ReplacePaths::for_original(original_path);
  FileSystem &fs = ctx_.fs;

  // **----- STEP 1: WRITE TEMP -----**

  int rc = ctx_.copier.copy(candidate_path, paths.temp);
  if (rc != 0) {
    return abort(result, paths,
                 fmt::format("copy to {} exited with {}", paths.temp, rc));
  }
  advance(result, paths, ReplaceState::TempWritten);

  // **----- STEPS 2+3: ATOMIC EXCHANGE -----**

  if (ctx_.config.atomic_exchange) {
    std::error_code ec = fs.exchange(paths.temp, paths.original);
    if (!ec) {
      result.exchanged = true;
      advance(result, paths, ReplaceState::Swapped);
      advance(result, paths, ReplaceState::Committed);
      /// The exchange left the previous content at <name>.tmp
      discard(paths, paths.temp);
      return result;
    }
    if (ec != std::errc::operation_not_supported) {
      return abort(result, paths,
                   fmt::format("exchange {} <-> {} failed: {}", paths.temp,
                               paths.original, ec.message()));
    }
  }

  // **----- STEP 2: MOVE ORIGINAL ASIDE -----**

  if (auto ec = fs.rename(paths.original, paths.old)) {
    return abort(result, paths,
                 fmt::format("rename {} -> {} failed: {}", paths.original,
                             paths.old, ec.message()));
  }
  advance(result, paths, ReplaceState::Swapped);

  // **----- STEP 3: PUBLISH -----**

  if (auto ec = fs.rename(paths.temp, paths.original)) {
    result.detail = fmt::format("rename {} -> {} failed: {}", paths.temp,
                                paths.original, ec.message());
    ctx_.events.critical(EventType::ReplaceFailed, paths.original,
                         fmt::format("Safe replace failed: {}", result.detail));
    roll_back(result, paths);
    return result;
  }
  advance(result, paths, ReplaceState::Committed);

  // **----- STEP 4: DROP PREVIOUS CONTENT -----**

  discard(paths, paths.old);
  return result;
}

} // namespace transcode_watchdog
