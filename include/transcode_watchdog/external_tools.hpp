/**
 * @file external_tools.hpp
 * @brief Real encoder, copier and filesystem implementations
 *
 * @details
 *          - HandBrakeEncoder: runs HandBrakeCLI with an imported preset
 *
 *          - RsyncCopier: runs rsync -avh
 *
 *          - LocalFileSystem: std::filesystem plus renameat2 for exchange
 *
 * @note Every command is announced on the event sink before it runs, and a
 *       non-zero exit is reported with its captured output.
 */

#ifndef TRANSCODE_WATCHDOG_EXTERNAL_TOOLS_HPP
#define TRANSCODE_WATCHDOG_EXTERNAL_TOOLS_HPP

#include <string>
#include <vector>

#include "events.hpp"
#include "process.hpp"
#include "tools.hpp"

namespace transcode_watchdog {

/**
 * @brief Run a command, reporting it on the sink.
 * @return The process result, unchanged
 */
ProcessResult run_reported(EventSink &events,
                           const std::vector<std::string> &argv);

class HandBrakeEncoder : public Encoder {
public:
  explicit HandBrakeEncoder(EventSink &events) : events_(events) {}

  int encode(const std::string &preset_file, const std::string &preset_name,
             const std::string &input_path,
             const std::string &output_path) override;

private:
  EventSink &events_;
};

class RsyncCopier : public Copier {
public:
  explicit RsyncCopier(EventSink &events) : events_(events) {}

  int copy(const std::string &source, const std::string &destination) override;

private:
  EventSink &events_;
};

/**
 * @class LocalFileSystem
 * @brief FileSystem over the mounted filesystems of this host.
 *
 * @note exchange() uses renameat2(RENAME_EXCHANGE). Filesystems without
 *       support (many network mounts, older kernels) report EINVAL or
 *       ENOSYS, which is mapped to operation_not_supported.
 */
class LocalFileSystem : public FileSystem {
public:
  bool exists(const std::string &path) override;
  std::optional<uint64_t> file_size(const std::string &path) override;
  std::error_code rename(const std::string &from,
                         const std::string &to) override;
  std::error_code exchange(const std::string &a,
                           const std::string &b) override;
  std::error_code remove(const std::string &path) override;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_EXTERNAL_TOOLS_HPP
