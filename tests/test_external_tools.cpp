// Real process runner and local filesystem primitives.

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "transcode_watchdog/external_tools.hpp"
#include "transcode_watchdog/process.hpp"

namespace transcode_watchdog {
namespace {

using namespace test_support;

// -----------------------------------------------------------------------------
// run_process
// -----------------------------------------------------------------------------

TEST(RunProcessTest, CapturesExitCodeAndBothStreams) {
  ProcessResult r =
      run_process({"sh", "-c", "echo out; echo err >&2; exit 3"});

  EXPECT_EQ(r.exit_code, 3);
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.stdout_text, "out\n");
  EXPECT_EQ(r.stderr_text, "err\n");
}

TEST(RunProcessTest, ZeroExitIsSuccess) {
  ProcessResult r = run_process({"sh", "-c", "exit 0"});
  EXPECT_TRUE(r.ok());
}

TEST(RunProcessTest, ArgumentsAreNotShellExpanded) {
  ProcessResult r = run_process({"echo", "$HOME 'quoted' ; rm -rf x"});

  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.stdout_text, "$HOME 'quoted' ; rm -rf x\n");
}

TEST(RunProcessTest, MissingProgramExits127) {
  ProcessResult r = run_process({"definitely-not-a-real-tool-xyz"});
  EXPECT_EQ(r.exit_code, 127);
}

TEST(RunProcessTest, KilledBySignalReports128PlusSignal) {
  ProcessResult r = run_process({"sh", "-c", "kill -9 $$"});
  EXPECT_EQ(r.exit_code, 128 + 9);
}

TEST(RunProcessTest, EmptyCommandIsNotStarted) {
  EXPECT_EQ(run_process({}).exit_code, -1);
}

TEST(QuoteCommandTest, QuotesOnlyWhatNeedsIt) {
  EXPECT_EQ(quote_command({"rsync", "-avh", "/media/a.mkv"}),
            "rsync -avh /media/a.mkv");
  EXPECT_EQ(quote_command({"ffprobe", "My Movie (2001).mkv"}),
            "ffprobe 'My Movie (2001).mkv'");
  EXPECT_EQ(quote_command({"echo", "it's", ""}),
            "echo 'it'\"'\"'s' ''");
}

TEST(RunReportedTest, FailureIsAnnouncedWithOutput) {
  RecordingSink events;

  ProcessResult r = run_reported(events, {"sh", "-c", "echo boom >&2; exit 4"});

  EXPECT_EQ(r.exit_code, 4);
  EXPECT_EQ(events.Count(EventType::CommandStarted), 1);
  ASSERT_EQ(events.Count(EventType::CommandFailed), 1);
  EXPECT_NE(events.events.back().message.find("boom"), std::string::npos);
}

// -----------------------------------------------------------------------------
// LocalFileSystem
// -----------------------------------------------------------------------------

TEST(LocalFileSystemTest, ExchangeSwapsContents) {
  TempDir dir;
  const std::string a = dir.file("a.mkv");
  const std::string b = dir.file("a.mkv.tmp");
  WriteFile(a, "A");
  WriteFile(b, "B");
  LocalFileSystem lfs;

  std::error_code ec = lfs.exchange(b, a);
  if (ec == std::errc::operation_not_supported)
    GTEST_SKIP() << "scratch filesystem has no RENAME_EXCHANGE";

  ASSERT_FALSE(ec) << ec.message();
  EXPECT_EQ(ReadFile(a), "B");
  EXPECT_EQ(ReadFile(b), "A");
}

TEST(LocalFileSystemTest, ExchangeWithMissingPathIsARealError) {
  TempDir dir;
  WriteFile(dir.file("a.mkv"), "A");
  LocalFileSystem lfs;

  std::error_code ec = lfs.exchange(dir.file("missing.tmp"), dir.file("a.mkv"));

  ASSERT_TRUE(ec);
  EXPECT_NE(ec, std::errc::operation_not_supported);
  EXPECT_EQ(ReadFile(dir.file("a.mkv")), "A");
}

TEST(LocalFileSystemTest, RenameSizeAndRemove) {
  TempDir dir;
  const std::string from = dir.file("x.mkv");
  const std::string to = dir.file("x.mkv.old");
  WriteBytes(from, 10);
  LocalFileSystem lfs;

  EXPECT_FALSE(lfs.rename(from, to));
  EXPECT_FALSE(lfs.exists(from));
  EXPECT_EQ(lfs.file_size(to), std::optional<uint64_t>(10));
  EXPECT_FALSE(lfs.file_size(from).has_value());
  EXPECT_TRUE(lfs.rename(from, to));

  EXPECT_FALSE(lfs.remove(to));
  EXPECT_FALSE(lfs.exists(to));
  // Removing what is already gone is not an error.
  EXPECT_FALSE(lfs.remove(to));
}

} // namespace
} // namespace transcode_watchdog
