/**
 * @file batch_processor.hpp
 * @brief Per-file driver for a watchdog run
 *
 * @details The BatchProcessor runs the library through the pipeline:
 *
 *          1. Inspection phase: every enumerated file not already in the
 *             idempotency log is inspected; Pass files are logged by the
 *             Inspector, Queue files form the transcode queue
 *
 *          2. Transcode phase: each queued file, in discovery order, goes
 *             through Transcoder -> Verifier -> efficiency gate -> Replacer,
 *             and is appended to the idempotency log on full success
 *
 *          3. Summary of outcomes per failure kind
 *
 * @attention FAILURE ISOLATION:
 *
 *   - One file is processed to completion before the next starts
 *
 *   - Every per-file failure becomes a FileOutcome; none aborts the run
 *
 *   - A std::exception escaping a stage is caught at the per-file boundary
 *     and reported as UnhandledFailure
 */

#ifndef TRANSCODE_WATCHDOG_BATCH_PROCESSOR_HPP
#define TRANSCODE_WATCHDOG_BATCH_PROCESSOR_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "context.hpp"
#include "idempotency_log.hpp"
#include "types.hpp"

namespace transcode_watchdog {

/**
 * @struct FileOutcome
 * @brief Result of pushing one queued file through the pipeline.
 */
struct FileOutcome {
  std::string path;                        //< Original file
  FailureKind failure = FailureKind::None; //< None when replaced
  bool replaced = false;                   //< New content published
  uint64_t bytes_saved = 0;                //< Original minus candidate size
  std::string detail;                      //< Failure description
  long processing_time_us = 0;             //< Wall time for this file
};

/**
 * @struct RunSummary
 * @brief Aggregated outcome of one run.
 */
struct RunSummary {
  int discovered = 0; //< Files yielded by enumeration
  int skipped = 0;    //< Already in the idempotency log
  int passed = 0;     //< Inspector PASS
  int queued = 0;     //< Inspector QUEUE
  int replaced = 0;   //< Fully committed
  uint64_t bytes_saved = 0;
  double wall_clock_sec = 0.0;
  std::map<FailureKind, int> failures;
  std::vector<FileOutcome> outcomes; //< One per queued file

  int failure_count(FailureKind kind) const;
};

class BatchProcessor {
public:
  BatchProcessor(RunContext &ctx, IdempotencyLog &log)
      : ctx_(ctx), log_(log) {}

  /**
   * @brief Inspect and process all files.
   * @param files Enumerated media paths, in discovery order
   */
  RunSummary run(const std::vector<std::string> &files);

  /**
   * @brief Inspection phase only.
   * @return Files queued for transcoding
   */
  std::vector<std::string> inspect_all(const std::vector<std::string> &files,
                                       RunSummary &summary);

  /**
   * @brief Push one queued file through transcode, verify and replace.
   * @note Never throws.
   */
  FileOutcome process_file(const std::string &source_path);

  /**
   * @brief Print the final run summary table.
   */
  static void print_summary(const RunSummary &summary);

private:
  RunContext &ctx_;
  IdempotencyLog &log_;

  FileOutcome run_pipeline(const std::string &source_path);
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_BATCH_PROCESSOR_HPP
