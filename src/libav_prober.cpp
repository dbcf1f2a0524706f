/**
 * @file libav_prober.cpp
 * @brief libavformat-based metadata probe
 */

#include "transcode_watchdog/libav_prober.hpp"

#include <filesystem>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include <fmt/core.h>

namespace transcode_watchdog {

namespace {

/**
 * @class FormatInput
 * @brief RAII owner of an opened AVFormatContext.
 */
class FormatInput {
public:
  FormatInput() = default;
  ~FormatInput() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }

  /// Disable copy
  FormatInput(const FormatInput &) = delete;
  FormatInput &operator=(const FormatInput &) = delete;

  /// @return 0 on success, negative AVERROR otherwise
  int open(const std::string &path) {
    int ret = avformat_open_input(&ctx_, path.c_str(), nullptr, nullptr);
    if (ret < 0)
      return ret;
    return avformat_find_stream_info(ctx_, nullptr);
  }

  AVFormatContext *get() const { return ctx_; }

private:
  AVFormatContext *ctx_ = nullptr;
};

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

StreamType to_stream_type(AVMediaType type) {
  switch (type) {
  case AVMEDIA_TYPE_VIDEO:
    return StreamType::Video;
  case AVMEDIA_TYPE_AUDIO:
    return StreamType::Audio;
  case AVMEDIA_TYPE_SUBTITLE:
    return StreamType::Subtitle;
  default:
    return StreamType::Other;
  }
}

} // anonymous namespace

LibavProber::LibavProber(EventSink &events) : events_(events) {
  /// Match ffprobe -v quiet: decoding noise is reported through our events
  av_log_set_level(AV_LOG_QUIET);
}

std::optional<MediaInfo> LibavProber::probe(const std::string &path) {
  FormatInput input;
  int ret = input.open(path);
  if (ret < 0) {
    events_.warning(EventType::ProbeFailed, path,
                    fmt::format("libav could not read {}: {}", path,
                                av_error_string(ret)));
    return std::nullopt;
  }

  AVFormatContext *ctx = input.get();
  MediaInfo info;

  int64_t size = ctx->pb ? avio_size(ctx->pb) : -1;
  if (size < 0) {
    std::error_code ec;
    auto fs_size = std::filesystem::file_size(path, ec);
    size = ec ? 0 : static_cast<int64_t>(fs_size);
  }
  info.size_bytes = static_cast<uint64_t>(size);

  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
    info.duration_sec = static_cast<double>(ctx->duration) / AV_TIME_BASE;
  }

  for (unsigned int i = 0; i < ctx->nb_streams; ++i) {
    const AVCodecParameters *par = ctx->streams[i]->codecpar;
    StreamInfo stream;
    stream.type = to_stream_type(par->codec_type);
    stream.codec = avcodec_get_name(par->codec_id);
    info.streams.push_back(std::move(stream));
  }

  return info;
}

bool LibavProber::health_check(const std::string &path) {
  FormatInput input;
  int ret = input.open(path);
  if (ret < 0) {
    events_.warning(EventType::HealthCheckFailed, path,
                    fmt::format("libav health probe failed for {}: {}", path,
                                av_error_string(ret)));
    return false;
  }
  return true;
}

} // namespace transcode_watchdog
