/**
 * @file main.cpp
 * @brief Entry point for Transcode Watchdog
 *
 * @details Main entry point that handles:
 *
 *          - Configuration loading from the environment
 *
 *          - Activity log setup
 *
 *          - Required tool check (the only fatal per-run failure)
 *
 *          - Library scan and the batch run
 *
 * @note Positional arguments, when given, replace MEDIA_DIRECTORIES.
 *       Per-file failures never change the exit status.
 */

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "transcode_watchdog/batch_processor.hpp"
#include "transcode_watchdog/config.hpp"
#include "transcode_watchdog/context.hpp"
#include "transcode_watchdog/external_tools.hpp"
#include "transcode_watchdog/ffprobe_prober.hpp"
#include "transcode_watchdog/idempotency_log.hpp"
#include "transcode_watchdog/libav_prober.hpp"
#include "transcode_watchdog/logging.hpp"
#include "transcode_watchdog/media_scanner.hpp"
#include "transcode_watchdog/system.hpp"

using namespace transcode_watchdog;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc > 1 && (std::string(argv[1]) == "-h" ||
                   std::string(argv[1]) == "--help")) {
    fmt::print("Usage: {} [media_dir ...]\n"
               "Configuration is read from the environment; see "
               "config/transcode_watchdog.env\n",
               argv[0]);
    return 1;
  }

  WatchdogConfig config;
  try {
    config = load_config();
  } catch (const ConfigError &e) {
    LOG_CRITICAL("Invalid configuration: {}", e.what());
    return 2;
  }

  if (argc > 1) {
    config.media_directories.clear();
    for (int i = 1; i < argc; ++i)
      config.media_directories.push_back(expand_user(argv[i]));
  }

  if (!open_activity_log(config.activity_log)) {
    LOG_WARN("Cannot open activity log {}; logging to console only",
             config.activity_log);
  }
  LOG_INFO("Starting Jellyfin AV1 Transcoding Watchdog");

  // **---- TOOL CHECK ----**

  std::vector<std::string> tools = required_tools(config);
  std::vector<std::string> missing = missing_tools(tools);
  if (!missing.empty()) {
    LOG_CRITICAL("Missing required tools: {}", fmt::join(missing, ", "));
    LOG_CRITICAL("Ensure they are installed and available in PATH.");
    close_activity_log();
    return 1;
  }
  LOG_INFO("All required CLI tools found: {}", fmt::join(tools, ", "));

  std::error_code ec;
  std::filesystem::create_directories(config.temp_dir, ec);
  if (ec) {
    LOG_WARN("Cannot create staging directory {}: {}", config.temp_dir,
             ec.message());
  }

  // **---- STATE ----**

  IdempotencyLog inspected(config.inspected_log);
  LOG_INFO("Loaded {} previously inspected files", inspected.size());

  std::vector<std::string> dirs = existing_directories(config.media_directories);
  LOG_INFO("Scanning {} directories: [{}]", dirs.size(), fmt::join(dirs, ", "));
  std::vector<std::string> files = scan_media_files(dirs, config.extensions);

  // **---- RUN ----**

  LogEventSink events;
  std::unique_ptr<MetadataProber> prober;
  if (config.probe_backend == ProbeBackend::Libav) {
    prober = std::make_unique<LibavProber>(events);
  } else {
    prober = std::make_unique<FfprobeProber>(events);
  }
  HandBrakeEncoder encoder(events);
  RsyncCopier copier(events);
  LocalFileSystem fs;

  RunContext ctx{config, events, *prober, encoder, copier, fs};
  BatchProcessor processor(ctx, inspected);
  RunSummary summary = processor.run(files);
  BatchProcessor::print_summary(summary);

  LOG_INFO("Watchdog run complete");
  close_activity_log();
  return 0;
}
