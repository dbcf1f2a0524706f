// Inspector: Pass/Queue policy, size threshold and logging of passed files.

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "transcode_watchdog/idempotency_log.hpp"
#include "transcode_watchdog/inspector.hpp"

namespace transcode_watchdog {
namespace {

using namespace test_support;

TEST(SizeLimitTest, TruncatesFractionalBytes) {
  EXPECT_EQ(size_limit_bytes(0.005), 5368709u);
  EXPECT_EQ(size_limit_bytes(1.0), 1073741824u);
  EXPECT_EQ(size_limit_bytes(0.0), 0u);
}

class InspectorTest : public ::testing::Test {
protected:
  Harness h;
  IdempotencyLog log{h.config.inspected_log};
  Inspector inspector{h.ctx, log};
};

// -----------------------------------------------------------------------------
// av1 and under the limit: Pass, recorded exactly once
// -----------------------------------------------------------------------------
TEST_F(InspectorTest, SmallTargetCodecFilePassesAndIsLogged) {
  const std::string path = h.LibraryFile("a.mkv");
  h.prober.media[path] = MakeMedia(1000, 60.0, "av1");

  InspectionVerdict v = inspector.inspect(path);

  EXPECT_TRUE(v.passed());
  EXPECT_TRUE(v.reasons.empty());
  EXPECT_TRUE(log.contains(path));
  EXPECT_EQ(ReadFile(h.config.inspected_log), path + "\n");
  EXPECT_TRUE(h.events.Has(EventType::Passed));
}

TEST_F(InspectorTest, SizeAtLimitIsQueued) {
  const std::string path = h.LibraryFile("edge.mkv");
  h.prober.media[path] = MakeMedia(5368709, 60.0, "av1");

  InspectionVerdict v = inspector.inspect(path);

  EXPECT_FALSE(v.passed());
  ASSERT_EQ(v.reasons.size(), 1u);
  EXPECT_EQ(v.reasons[0], "file size exceeds limit");
  EXPECT_FALSE(log.contains(path));
}

TEST_F(InspectorTest, SizeJustUnderLimitPasses) {
  const std::string path = h.LibraryFile("edge.mkv");
  h.prober.media[path] = MakeMedia(5368708, 60.0, "av1");

  EXPECT_TRUE(inspector.inspect(path).passed());
}

TEST_F(InspectorTest, WrongCodecIsQueuedWithCodecReason) {
  const std::string path = h.LibraryFile("h264.mp4");
  h.prober.media[path] = MakeMedia(1000, 60.0, "h264");

  InspectionVerdict v = inspector.inspect(path);

  EXPECT_FALSE(v.passed());
  ASSERT_EQ(v.reasons.size(), 1u);
  EXPECT_EQ(v.reasons[0], "codec is h264");
  EXPECT_TRUE(h.events.Has(EventType::Queued));
  EXPECT_FALSE(log.contains(path));
}

TEST_F(InspectorTest, LargeWrongCodecCarriesBothReasons) {
  const std::string path = h.LibraryFile("big.mkv");
  h.prober.media[path] = MakeMedia(10'000'000, 60.0, "hevc");

  InspectionVerdict v = inspector.inspect(path);

  ASSERT_EQ(v.reasons.size(), 2u);
  EXPECT_EQ(v.reasons[0], "codec is hevc");
  EXPECT_EQ(v.reasons[1], "file size exceeds limit");
}

TEST_F(InspectorTest, NoVideoStreamReportsCodecNone) {
  const std::string path = h.LibraryFile("audio_only.mkv");
  h.prober.media[path] = MakeMedia(1000, 60.0, "", /*video=*/0);

  InspectionVerdict v = inspector.inspect(path);

  EXPECT_FALSE(v.passed());
  EXPECT_EQ(v.reasons.front(), "codec is none");
}

TEST_F(InspectorTest, FirstVideoStreamDecides) {
  const std::string path = h.LibraryFile("two_video.mkv");
  MediaInfo info = MakeMedia(1000, 60.0, "h264");
  info.streams.push_back({StreamType::Video, "av1"});
  h.prober.media[path] = info;

  EXPECT_FALSE(inspector.inspect(path).passed());
}

// -----------------------------------------------------------------------------
// Unreadable metadata fails open: the file is queued, never skipped
// -----------------------------------------------------------------------------
TEST_F(InspectorTest, ProbeFailureQueues) {
  const std::string path = h.LibraryFile("corrupt.mkv");

  InspectionVerdict v = inspector.inspect(path);

  EXPECT_FALSE(v.passed());
  ASSERT_EQ(v.reasons.size(), 1u);
  EXPECT_EQ(v.reasons[0], "metadata unavailable");
  EXPECT_FALSE(log.contains(path));
  EXPECT_EQ(h.prober.probe_calls[path], 1);
}

TEST_F(InspectorTest, TargetCodecIsConfigurable) {
  h.config.target_codec = "hevc";
  const std::string path = h.LibraryFile("x.mkv");
  h.prober.media[path] = MakeMedia(1000, 60.0, "hevc");

  EXPECT_TRUE(inspector.inspect(path).passed());
}

} // namespace
} // namespace transcode_watchdog
