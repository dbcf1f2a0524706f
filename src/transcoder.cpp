/**
 * @file transcoder.cpp
 * @brief Transcoder implementation
 */

#include "transcode_watchdog/transcoder.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>

#include <fmt/core.h>

namespace transcode_watchdog {

namespace fs = std::filesystem;

TranscodeJob make_job(const std::string &source_path,
                      const std::string &temp_dir) {
  fs::path source(source_path);
  TranscodeJob job;
  job.source_path = source_path;
  job.staged_path = (fs::path(temp_dir) / source.filename()).string();
  job.candidate_path =
      (fs::path(temp_dir) / (source.stem().string() + CANDIDATE_SUFFIX))
          .string();
  return job;
}

// **---- Job Cleanup ----**

JobFiles::~JobFiles() {
  /// May run during unwinding, so nothing here is allowed to escape
  try {
    for (const std::string *p : {&job_.staged_path, &job_.candidate_path}) {
      if (p->empty() || !fs_.exists(*p))
        continue;
      if (auto ec = fs_.remove(*p)) {
        events_.warning(EventType::CleanupFailed, job_.source_path,
                        fmt::format("Could not delete local file {}: {}", *p,
                                    ec.message()));
      }
    }
  } catch (const std::exception &e) {
    std::fprintf(stderr, "Cleanup of %s failed: %s\n",
                 job_.source_path.c_str(), e.what());
  }
}

// **---- Transcode ----**

TranscodeResult Transcoder::transcode(const std::string &source_path,
                                      const std::string &preset_file,
                                      const std::string &preset_name,
                                      const std::string &temp_dir) {
  TranscodeResult result;
  result.job = make_job(source_path, temp_dir);
  const TranscodeJob &job = result.job;

  /// Stage the original locally
  int rc = ctx_.copier.copy(job.source_path, job.staged_path);
  if (rc != 0) {
    if (auto ec = ctx_.fs.remove(job.staged_path)) {
      ctx_.events.warning(EventType::CleanupFailed, source_path,
                          fmt::format("Could not delete partial copy {}: {}",
                                      job.staged_path, ec.message()));
    }
    result.failure = FailureKind::CopyFailure;
    result.detail = fmt::format("copy to local staging exited with {}", rc);
    ctx_.events.error(EventType::CopyFailed, source_path,
                      fmt::format("Failed to copy source to local temp: {}",
                                  source_path));
    return result;
  }

  /// Encode
  rc = ctx_.encoder.encode(preset_file, preset_name, job.staged_path,
                           job.candidate_path);
  bool produced = ctx_.fs.exists(job.candidate_path);
  if (rc != 0 || !produced) {
    if (produced) {
      if (auto ec = ctx_.fs.remove(job.candidate_path)) {
        ctx_.events.warning(EventType::CleanupFailed, source_path,
                            fmt::format("Could not delete partial output {}: {}",
                                        job.candidate_path, ec.message()));
      }
    }
    result.failure = FailureKind::EncodeFailure;
    result.detail = rc != 0 ? fmt::format("encoder exited with {}", rc)
                            : std::string("encoder produced no output");
    ctx_.events.error(EventType::EncodeFailed, source_path,
                      fmt::format("Transcode failed for {} ({})", source_path,
                                  result.detail));
    return result;
  }

  return result;
}

} // namespace transcode_watchdog
