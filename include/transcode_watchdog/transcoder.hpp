/**
 * @file transcoder.hpp
 * @brief Local staging and re-encode of one queued file
 *
 * @details The Transcoder:
 *
 *          1. Copies the source into the staging directory under its
 *             original filename
 *
 *          2. Runs the encoder with the configured preset, writing
 *             <basename-without-extension>.av1.mkv beside the staged copy
 *
 *          3. Accepts the result only if the encoder exited 0 AND the output
 *             exists
 */

#ifndef TRANSCODE_WATCHDOG_TRANSCODER_HPP
#define TRANSCODE_WATCHDOG_TRANSCODER_HPP

#include <string>

#include "context.hpp"
#include "types.hpp"

namespace transcode_watchdog {

/**
 * @struct TranscodeJob
 * @brief Paths of one file's job. Lives only while the file is processed.
 */
struct TranscodeJob {
  std::string source_path;    //< Original on durable storage
  std::string staged_path;    //< Local copy of the original
  std::string candidate_path; //< Local encoder output
};

/**
 * @brief Derive the job paths for a source file and staging directory.
 */
TranscodeJob make_job(const std::string &source_path,
                      const std::string &temp_dir);

/**
 * @struct TranscodeResult
 * @brief Outcome of the transcode stage.
 */
struct TranscodeResult {
  FailureKind failure = FailureKind::None; //< CopyFailure or EncodeFailure
  TranscodeJob job;
  std::string detail;

  bool ok() const { return failure == FailureKind::None; }
};

/**
 * @class JobFiles
 * @brief Deletes a job's local files when the job ends, whatever the outcome.
 */
class JobFiles {
public:
  JobFiles(FileSystem &fs, EventSink &events, TranscodeJob job)
      : fs_(fs), events_(events), job_(std::move(job)) {}
  ~JobFiles();

  /// Disable copy
  JobFiles(const JobFiles &) = delete;
  JobFiles &operator=(const JobFiles &) = delete;

private:
  FileSystem &fs_;
  EventSink &events_;
  TranscodeJob job_;
};

class Transcoder {
public:
  explicit Transcoder(RunContext &ctx) : ctx_(ctx) {}

  /**
   * @brief Stage and encode one file.
   *
   * @param source_path Original file on durable storage
   * @param preset_file Encoder preset file
   * @param preset_name Preset name inside the preset file
   * @param temp_dir Local staging directory
   *
   * @note On failure no partial file of the failing step is left behind.
   */
  TranscodeResult transcode(const std::string &source_path,
                            const std::string &preset_file,
                            const std::string &preset_name,
                            const std::string &temp_dir);

private:
  RunContext &ctx_;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_TRANSCODER_HPP
