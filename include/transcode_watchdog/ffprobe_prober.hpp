/**
 * @file ffprobe_prober.hpp
 * @brief MetadataProber backed by the ffprobe command
 *
 * @details Metadata comes from
 *          `ffprobe -v quiet -print_format json -show_format -show_streams`,
 *          parsed with nlohmann::json. The health probe is
 *          `ffprobe -v error -hide_banner <file>`.
 */

#ifndef TRANSCODE_WATCHDOG_FFPROBE_PROBER_HPP
#define TRANSCODE_WATCHDOG_FFPROBE_PROBER_HPP

#include <optional>
#include <string>

#include "events.hpp"
#include "tools.hpp"

namespace transcode_watchdog {

/**
 * @brief Parse ffprobe JSON output.
 *
 * @note format.size and format.duration may be strings or numbers; missing
 *       or non-numeric values read as 0. Streams keep container order.
 *
 * @return Metadata, or std::nullopt if the text is not a JSON object
 */
std::optional<MediaInfo> parse_ffprobe_json(const std::string &text);

class FfprobeProber : public MetadataProber {
public:
  explicit FfprobeProber(EventSink &events) : events_(events) {}

  std::optional<MediaInfo> probe(const std::string &path) override;
  bool health_check(const std::string &path) override;

private:
  EventSink &events_;
};

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_FFPROBE_PROBER_HPP
