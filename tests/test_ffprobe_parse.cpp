// ffprobe JSON parsing: tolerant field handling and stream ordering.

#include <gtest/gtest.h>

#include "transcode_watchdog/ffprobe_prober.hpp"

namespace transcode_watchdog {
namespace {

TEST(FfprobeParseTest, ReadsFormatAndStreamsInOrder) {
  const std::string text = R"({
    "streams": [
      {"index": 0, "codec_name": "h264", "codec_type": "video"},
      {"index": 1, "codec_name": "aac", "codec_type": "audio"},
      {"index": 2, "codec_name": "ac3", "codec_type": "audio"},
      {"index": 3, "codec_name": "subrip", "codec_type": "subtitle"},
      {"index": 4, "codec_type": "attachment"}
    ],
    "format": {"filename": "x.mkv", "size": "1048576", "duration": "5400.250000"}
  })";

  auto info = parse_ffprobe_json(text);

  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->size_bytes, 1048576u);
  EXPECT_DOUBLE_EQ(info->duration_sec, 5400.25);
  ASSERT_EQ(info->streams.size(), 5u);
  EXPECT_EQ(info->video_codec(), "h264");
  EXPECT_EQ(info->count(StreamType::Audio), 2);
  EXPECT_EQ(info->count(StreamType::Subtitle), 1);
  EXPECT_EQ(info->streams[4].type, StreamType::Other);
  EXPECT_EQ(info->streams[4].codec, "");
}

TEST(FfprobeParseTest, AcceptsNumericFields) {
  auto info = parse_ffprobe_json(
      R"({"format": {"size": 2048, "duration": 12.5}, "streams": []})");

  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->size_bytes, 2048u);
  EXPECT_DOUBLE_EQ(info->duration_sec, 12.5);
}

// -----------------------------------------------------------------------------
// Missing or unparseable numbers read as zero
// -----------------------------------------------------------------------------
TEST(FfprobeParseTest, MissingOrInvalidNumbersAreZero) {
  auto info = parse_ffprobe_json(
      R"({"format": {"size": "N/A"}, "streams": [{"codec_type": "video"}]})");

  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->size_bytes, 0u);
  EXPECT_DOUBLE_EQ(info->duration_sec, 0.0);
  EXPECT_EQ(info->video_codec(), "");
}

TEST(FfprobeParseTest, MissingSectionsGiveEmptyMetadata) {
  auto info = parse_ffprobe_json("{}");

  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->size_bytes, 0u);
  EXPECT_TRUE(info->streams.empty());
}

TEST(FfprobeParseTest, GarbageIsRejected) {
  EXPECT_FALSE(parse_ffprobe_json("").has_value());
  EXPECT_FALSE(parse_ffprobe_json("not json").has_value());
  EXPECT_FALSE(parse_ffprobe_json("[1, 2, 3]").has_value());
}

} // namespace
} // namespace transcode_watchdog
