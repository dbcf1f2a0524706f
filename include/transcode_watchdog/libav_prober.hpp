/**
 * @file libav_prober.hpp
 * @brief In-process MetadataProber using libavformat
 *
 * @details Opens the container with avformat_open_input and
 *          avformat_find_stream_info, the same calls ffprobe makes, without
 *          spawning a process per file. Codec names come from
 *          avcodec_get_name and match ffprobe's codec_name ("av1", "hevc").
 *
 * @attention THREAD MODEL:
 *            - Stateless; every call opens and closes its own
 *              AVFormatContext.
 */

#ifndef TRANSCODE_WATCHDOG_LIBAV_PROBER_HPP
#define TRANSCODE_WATCHDOG_LIBAV_PROBER_HPP

#include <optional>
#include <string>

#include "events.hpp"
#include "tools.hpp"

namespace transcode_watchdog {

class LibavProber : public MetadataProber {
public:
  explicit LibavProber(EventSink &events);

  std::optional<MediaInfo> probe(const std::string &path) override;
  bool health_check(const std::string &path) override;

private:
  EventSink &events_;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_LIBAV_PROBER_HPP
