/**
 * @file external_tools.cpp
 * @brief HandBrakeCLI, rsync and local filesystem implementations
 */

#include "transcode_watchdog/external_tools.hpp"

#include <cerrno>
#include <filesystem>

#include <fcntl.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <fmt/core.h>

#ifndef RENAME_EXCHANGE
#define RENAME_EXCHANGE (1 << 1)
#endif

namespace transcode_watchdog {

namespace fs = std::filesystem;

// **---- Command Reporting ----**

ProcessResult run_reported(EventSink &events,
                           const std::vector<std::string> &argv) {
  std::string cmd = quote_command(argv);
  events.info(EventType::CommandStarted, "", fmt::format("Running: {}", cmd));

  ProcessResult result = run_process(argv);
  if (!result.ok()) {
    events.warning(EventType::CommandFailed, "",
                   fmt::format("Command failed (rc={}): {}\nSTDOUT: {}\nSTDERR: {}",
                               result.exit_code, cmd, result.stdout_text,
                               result.stderr_text));
  }
  return result;
}

// **---- HandBrakeCLI ----**

int HandBrakeEncoder::encode(const std::string &preset_file,
                             const std::string &preset_name,
                             const std::string &input_path,
                             const std::string &output_path) {
  return run_reported(events_, {"HandBrakeCLI", "--preset-import-file",
                                preset_file, "-i", input_path, "-o",
                                output_path, "--preset", preset_name})
      .exit_code;
}

// **---- rsync ----**

int RsyncCopier::copy(const std::string &source,
                      const std::string &destination) {
  return run_reported(events_,
                      {"rsync", "-avh", "--progress", source, destination})
      .exit_code;
}

// **---- Local Filesystem ----**

bool LocalFileSystem::exists(const std::string &path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

std::optional<uint64_t> LocalFileSystem::file_size(const std::string &path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec)
    return std::nullopt;
  return static_cast<uint64_t>(size);
}

std::error_code LocalFileSystem::rename(const std::string &from,
                                        const std::string &to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  return ec;
}

std::error_code LocalFileSystem::exchange(const std::string &a,
                                          const std::string &b) {
#ifdef SYS_renameat2
  if (syscall(SYS_renameat2, AT_FDCWD, a.c_str(), AT_FDCWD, b.c_str(),
              RENAME_EXCHANGE) == 0) {
    return {};
  }
  int err = errno;
  if (err == EINVAL || err == ENOSYS || err == EOPNOTSUPP)
    return std::make_error_code(std::errc::operation_not_supported);
  return std::error_code(err, std::generic_category());
#else
  (void)a;
  (void)b;
  return std::make_error_code(std::errc::operation_not_supported);
#endif
}

std::error_code LocalFileSystem::remove(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  return ec;
}

} // namespace transcode_watchdog
