// Transcoder: local staging, encode, and cleanup of partial files.

#include <gtest/gtest.h>

#include <stdexcept>

#include "fakes.hpp"
#include "transcode_watchdog/transcoder.hpp"

namespace transcode_watchdog {
namespace {

using namespace test_support;

// Every remove fails.
class UndeletableFileSystem : public FaultyFileSystem {
public:
  std::error_code remove(const std::string &) override {
    return std::make_error_code(std::errc::permission_denied);
  }
};

// Every emit throws.
class BrokenSink : public EventSink {
public:
  void emit(const Event &) override { throw std::runtime_error("sink down"); }
};

TEST(MakeJobTest, DerivesStagedAndCandidatePaths) {
  TranscodeJob job = make_job("/media/movies/Film (2001).mp4", "/tmp/transcoding/");

  EXPECT_EQ(job.source_path, "/media/movies/Film (2001).mp4");
  EXPECT_EQ(job.staged_path, "/tmp/transcoding/Film (2001).mp4");
  EXPECT_EQ(job.candidate_path, "/tmp/transcoding/Film (2001).av1.mkv");
}

class TranscoderTest : public ::testing::Test {
protected:
  void SetUp() override { WriteBytes(source, 4096); }

  Harness h;
  Transcoder transcoder{h.ctx};
  std::string source = h.LibraryFile("movie.mp4");

  TranscodeResult Run() {
    return transcoder.transcode(source, "preset.json", "AV1", h.config.temp_dir);
  }
};

TEST_F(TranscoderTest, SuccessLeavesStagedCopyAndCandidate) {
  TranscodeResult r = Run();

  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(fs::exists(r.job.staged_path));
  EXPECT_EQ(fs::file_size(r.job.candidate_path), 3u * 1024);
  ASSERT_EQ(h.encoder.calls.size(), 1u);
  EXPECT_EQ(h.encoder.calls[0].first, r.job.staged_path);
  EXPECT_EQ(h.encoder.calls[0].second, r.job.candidate_path);
  // Source is untouched.
  EXPECT_EQ(fs::file_size(source), 4096u);
}

TEST_F(TranscoderTest, CopyFailureRemovesPartialCopyAndSkipsEncode) {
  TranscodeJob job = make_job(source, h.config.temp_dir);
  h.copier.fail_destinations.insert(job.staged_path);

  TranscodeResult r = Run();

  EXPECT_EQ(r.failure, FailureKind::CopyFailure);
  EXPECT_FALSE(fs::exists(job.staged_path));
  EXPECT_TRUE(h.encoder.calls.empty());
  EXPECT_TRUE(h.events.Has(EventType::CopyFailed));
}

TEST_F(TranscoderTest, EncoderFailureRemovesPartialOutput) {
  h.encoder.exit_code = 3;
  h.encoder.partial_on_failure = true;

  TranscodeResult r = Run();

  EXPECT_EQ(r.failure, FailureKind::EncodeFailure);
  EXPECT_FALSE(fs::exists(r.job.candidate_path));
  EXPECT_TRUE(h.events.Has(EventType::EncodeFailed));
}

TEST_F(TranscoderTest, ZeroExitWithoutOutputIsEncodeFailure) {
  h.encoder.produce_output = false;

  TranscodeResult r = Run();

  EXPECT_EQ(r.failure, FailureKind::EncodeFailure);
  EXPECT_EQ(r.detail, "encoder produced no output");
}

// -----------------------------------------------------------------------------
// JobFiles removes the local files when the job ends
// -----------------------------------------------------------------------------
TEST_F(TranscoderTest, JobFilesCleansUpOnScopeExit) {
  TranscodeResult r = Run();
  ASSERT_TRUE(r.ok());
  {
    JobFiles guard(h.fs, h.events, r.job);
  }
  EXPECT_FALSE(fs::exists(r.job.staged_path));
  EXPECT_FALSE(fs::exists(r.job.candidate_path));
  EXPECT_TRUE(fs::exists(source));
  EXPECT_FALSE(h.events.Has(EventType::CleanupFailed));
}

TEST_F(TranscoderTest, FailedCleanupIsReported) {
  TranscodeResult r = Run();
  ASSERT_TRUE(r.ok());
  UndeletableFileSystem stuck;
  {
    JobFiles guard(stuck, h.events, r.job);
  }
  EXPECT_EQ(h.events.Count(EventType::CleanupFailed), 2);
  EXPECT_TRUE(fs::exists(r.job.candidate_path));
}

TEST_F(TranscoderTest, CleanupReportFailureDoesNotEscapeDestructor) {
  TranscodeResult r = Run();
  ASSERT_TRUE(r.ok());
  UndeletableFileSystem stuck;
  BrokenSink sink;

  EXPECT_NO_THROW({ JobFiles guard(stuck, sink, r.job); });
}

} // namespace
} // namespace transcode_watchdog
