/**
 * @file batch_processor.cpp
 * @brief Per-file driver implementation
 *
 * @details Implements the two phases of a run and the summary output:
 *
 *          - Inspection of every file not yet in the idempotency log
 *
 *          - Sequential processing of the transcode queue
 *
 *          - Summary table with counts per outcome
 */

#include "transcode_watchdog/batch_processor.hpp"

#include <chrono>
#include <exception>

#include <fmt/core.h>

#include "transcode_watchdog/inspector.hpp"
#include "transcode_watchdog/logging.hpp"
#include "transcode_watchdog/replacer.hpp"
#include "transcode_watchdog/system.hpp"
#include "transcode_watchdog/transcoder.hpp"
#include "transcode_watchdog/verifier.hpp"

namespace transcode_watchdog {

int RunSummary::failure_count(FailureKind kind) const {
  auto it = failures.find(kind);
  return it == failures.end() ? 0 : it->second;
}

// **---- Inspection Phase ----**

std::vector<std::string>
BatchProcessor::inspect_all(const std::vector<std::string> &files,
                            RunSummary &summary) {
  std::vector<std::string> queue;
  Inspector inspector(ctx_, log_);

  for (const auto &path : files) {
    ++summary.discovered;

    if (log_.contains(path)) {
      ++summary.skipped;
      ctx_.events.info(EventType::Skipped, path,
                       fmt::format("SKIP inspected: {}", path));
      continue;
    }

    bool needs_transcode = true;
    try {
      needs_transcode = !inspector.inspect(path).passed();
    } catch (const std::exception &e) {
      ctx_.events.error(EventType::Unhandled, path,
                        fmt::format("Inspection error for {}: {}", path,
                                    e.what()));
    }

    if (needs_transcode) {
      ++summary.queued;
      queue.push_back(path);
    } else {
      ++summary.passed;
    }
  }
  return queue;
}

// **---- Transcode Phase ----**

FileOutcome BatchProcessor::process_file(const std::string &source_path) {
  auto start = std::chrono::steady_clock::now();

  FileOutcome outcome;
  try {
    outcome = run_pipeline(source_path);
  } catch (const std::exception &e) {
    outcome = FileOutcome{};
    outcome.path = source_path;
    outcome.failure = FailureKind::UnhandledFailure;
    outcome.detail = e.what();
    ctx_.events.error(EventType::Unhandled, source_path,
                      fmt::format("Unhandled error processing {}: {}",
                                  source_path, e.what()));
  }

  auto end = std::chrono::steady_clock::now();
  outcome.processing_time_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start)
          .count();
  return outcome;
}

FileOutcome BatchProcessor::run_pipeline(const std::string &source_path) {
  const WatchdogConfig &config = ctx_.config;
  FileOutcome outcome;
  outcome.path = source_path;

  // **----- TRANSCODE -----**

  /// Local staging files go away when this function returns or throws
  JobFiles job_files(ctx_.fs, ctx_.events,
                     make_job(source_path, config.temp_dir));

  Transcoder transcoder(ctx_);
  TranscodeResult tr = transcoder.transcode(
      source_path, config.preset_file, config.preset_name, config.temp_dir);
  if (!tr.ok()) {
    outcome.failure = tr.failure;
    outcome.detail = tr.detail;
    return outcome;
  }
  const TranscodeJob &job = tr.job;

  // **----- VERIFY -----**

  Verifier verifier(ctx_);
  VerificationReport report = verifier.verify(job.staged_path, job.candidate_path);
  if (!report.passed()) {
    outcome.failure = FailureKind::VerificationFailure;
    outcome.detail = "verification failed";
    ctx_.events.error(EventType::Discarded, source_path,
                      "Verification failed; deleting transcoded file");
    return outcome;
  }

  // **----- EFFICIENCY GATE -----**

  auto original_size = ctx_.fs.file_size(job.staged_path);
  auto candidate_size = ctx_.fs.file_size(job.candidate_path);
  if (!original_size || !candidate_size) {
    outcome.failure = FailureKind::UnhandledFailure;
    outcome.detail = "failed to stat staged or candidate file";
    ctx_.events.error(EventType::Unhandled, source_path,
                      fmt::format("Failed to stat files for {}", source_path));
    return outcome;
  }

  if (!is_efficient(*original_size, *candidate_size)) {
    outcome.failure = FailureKind::EfficiencyRejection;
    outcome.detail = fmt::format("new {} >= orig {}", *candidate_size,
                                 *original_size);
    ctx_.events.info(EventType::EfficiencyRejected, source_path,
                     fmt::format("Not space-efficient (new {} >= orig {}); "
                                 "skipping replace",
                                 *candidate_size, *original_size));
    return outcome;
  }

  // **----- REPLACE -----**

  Replacer replacer(ctx_);
  ReplaceResult rr = replacer.replace(source_path, job.candidate_path);
  if (!rr.ok()) {
    outcome.failure = FailureKind::ReplaceFailure;
    outcome.detail = rr.detail;
    if (rr.state == ReplaceState::RolledBack) {
      ctx_.events.error(EventType::ReplaceFailed, source_path,
                        "Safe replace failed; original restored");
    }
    return outcome;
  }

  outcome.replaced = true;
  outcome.bytes_saved = *original_size - *candidate_size;

  if (auto ec = log_.append(source_path)) {
    ctx_.events.error(EventType::Committed, source_path,
                      fmt::format("Replaced {} but could not record it in {}: {}",
                                  source_path, log_.path(), ec.message()));
  }
  ctx_.events.info(EventType::Committed, source_path,
                   fmt::format("Successfully transcoded and replaced: {} "
                               "(saved {})",
                               source_path, format_bytes(outcome.bytes_saved)));
  return outcome;
}

// **---- Run ----**

RunSummary BatchProcessor::run(const std::vector<std::string> &files) {
  RunSummary summary;
  auto batch_start = std::chrono::steady_clock::now();

  LOG_PHASE("================== INSPECTION ==================");
  std::vector<std::string> queue = inspect_all(files, summary);
  LOG_INFO("Discovered {} candidate files before filtering", summary.discovered);
  LOG_INFO("Queue length: {}", queue.size());

  if (!queue.empty()) {
    LOG_PHASE("================== TRANSCODING =================");
  }

  int index = 0;
  for (const auto &path : queue) {
    LOG_PHASE("----------------------------------------");
    LOG_INFO("Processing {}/{}: {}", ++index, queue.size(), path);

    FileOutcome outcome = process_file(path);
    if (outcome.replaced) {
      ++summary.replaced;
      summary.bytes_saved += outcome.bytes_saved;
    } else {
      ++summary.failures[outcome.failure];
    }
    summary.outcomes.push_back(std::move(outcome));
  }

  auto batch_end = std::chrono::steady_clock::now();
  summary.wall_clock_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();
  return summary;
}

void BatchProcessor::print_summary(const RunSummary &summary) {
  LOG_PHASE("================ RUN SUMMARY =================");
  LOG_INFO("{:<28} {:>16}", "Discovered:", summary.discovered);
  LOG_INFO("{:<28} {:>16}", "Skipped (already logged):", summary.skipped);
  LOG_INFO("{:<28} {:>16}", "Passed:", summary.passed);
  LOG_INFO("{:<28} {:>16}", "Queued:", summary.queued);
  LOG_INFO("{:<28} {:>16}", "Replaced:", summary.replaced);
  for (const auto &entry : summary.failures) {
    LOG_INFO("{:<28} {:>16}", fmt::format("{}:", to_string(entry.first)),
             entry.second);
  }
  LOG_INFO("{:<28} {:>16}", "Space saved:", format_bytes(summary.bytes_saved));
  LOG_INFO("{:<28} {:>16}", "Wall-clock time:",
           format_time(summary.wall_clock_sec));
  LOG_PHASE("==============================================");

  for (const auto &outcome : summary.outcomes) {
    if (outcome.replaced)
      continue;
    if (outcome.failure == FailureKind::EfficiencyRejection) {
      LOG_INFO("  kept original: {} ({})", outcome.path, outcome.detail);
    } else {
      LOG_ERROR("  failed: {} [{}] {}", outcome.path, to_string(outcome.failure),
                outcome.detail);
    }
  }
}

} // namespace transcode_watchdog
