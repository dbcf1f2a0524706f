/**
 * @file ffprobe_prober.cpp
 * @brief ffprobe invocation and JSON parsing
 */

#include "transcode_watchdog/ffprobe_prober.hpp"

#include <cmath>

#include <nlohmann/json.hpp>

#include "transcode_watchdog/external_tools.hpp"

using json = nlohmann::json;

namespace transcode_watchdog {

namespace {

/// Numeric field that ffprobe may emit as a string; 0 when unusable
double number_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end())
    return 0.0;
  if (it->is_number())
    return it->get<double>();
  if (it->is_string()) {
    const auto &s = it->get_ref<const std::string &>();
    try {
      size_t used = 0;
      double v = std::stod(s, &used);
      return (used == s.size() && std::isfinite(v)) ? v : 0.0;
    } catch (const std::exception &) {
      return 0.0;
    }
  }
  return 0.0;
}

std::string string_field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return {};
  return it->get<std::string>();
}

} // anonymous namespace

std::optional<MediaInfo> parse_ffprobe_json(const std::string &text) {
  json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded() || !root.is_object())
    return std::nullopt;

  MediaInfo info;

  auto fmt_it = root.find("format");
  if (fmt_it != root.end() && fmt_it->is_object()) {
    double size = number_field(*fmt_it, "size");
    info.size_bytes = size > 0 ? static_cast<uint64_t>(size) : 0;
    info.duration_sec = number_field(*fmt_it, "duration");
  }

  auto streams_it = root.find("streams");
  if (streams_it != root.end() && streams_it->is_array()) {
    for (const auto &s : *streams_it) {
      if (!s.is_object())
        continue;
      StreamInfo stream;
      stream.type = stream_type_from_string(string_field(s, "codec_type"));
      stream.codec = string_field(s, "codec_name");
      info.streams.push_back(std::move(stream));
    }
  }

  return info;
}

std::optional<MediaInfo> FfprobeProber::probe(const std::string &path) {
  ProcessResult res =
      run_reported(events_, {"ffprobe", "-v", "quiet", "-print_format", "json",
                             "-show_format", "-show_streams", path});
  if (!res.ok())
    return std::nullopt;
  return parse_ffprobe_json(res.stdout_text);
}

bool FfprobeProber::health_check(const std::string &path) {
  return run_reported(events_, {"ffprobe", "-v", "error", "-hide_banner", path})
      .ok();
}

} // namespace transcode_watchdog
