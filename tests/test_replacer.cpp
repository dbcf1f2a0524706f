// Replacer: two-step rename transaction, rollback, and exchange mode.

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "transcode_watchdog/replacer.hpp"

namespace transcode_watchdog {
namespace {

using namespace test_support;

// Every rename onto blocked_target fails.
class StuckFileSystem : public FaultyFileSystem {
public:
  std::error_code rename(const std::string &from,
                         const std::string &to) override {
    if (to == blocked_target)
      return std::make_error_code(std::errc::io_error);
    return FaultyFileSystem::rename(from, to);
  }

  std::string blocked_target;
};

class ReplacerTest : public ::testing::Test {
protected:
  void SetUp() override {
    WriteFile(original, "OLD-CONTENT");
    WriteFile(candidate, "NEW");
  }

  Harness h;
  Replacer replacer{h.ctx};
  std::string original = h.LibraryFile("movie.mkv");
  std::string candidate = h.scratch.file("staging/movie.av1.mkv");
  ReplacePaths paths = ReplacePaths::for_original(original);
};

TEST_F(ReplacerTest, DerivesSiblingPaths) {
  EXPECT_EQ(paths.temp, original + ".tmp");
  EXPECT_EQ(paths.old, original + ".old");
}

TEST_F(ReplacerTest, TwoStepReplaceCommits) {
  ReplaceResult r = replacer.replace(original, candidate);

  EXPECT_TRUE(r.ok());
  EXPECT_FALSE(r.exchanged);
  EXPECT_EQ(ReadFile(original), "NEW");
  EXPECT_FALSE(fs::exists(paths.temp));
  EXPECT_FALSE(fs::exists(paths.old));
  EXPECT_EQ(h.events.Count(EventType::ReplaceStep), 3);
  EXPECT_EQ(h.fs.exchange_calls, 0);
}

TEST_F(ReplacerTest, TempWriteFailureLeavesOriginalUntouched) {
  h.copier.fail_destinations.insert(paths.temp);

  ReplaceResult r = replacer.replace(original, candidate);

  EXPECT_EQ(r.state, ReplaceState::Failed);
  EXPECT_EQ(ReadFile(original), "OLD-CONTENT");
  EXPECT_FALSE(fs::exists(paths.temp));
  EXPECT_TRUE(h.events.Has(EventType::ReplaceFailed));
}

TEST_F(ReplacerTest, MoveAsideFailureLeavesOriginalUntouched) {
  h.fs.fail_renames.insert({original, paths.old});

  ReplaceResult r = replacer.replace(original, candidate);

  EXPECT_EQ(r.state, ReplaceState::Failed);
  EXPECT_EQ(ReadFile(original), "OLD-CONTENT");
  EXPECT_FALSE(fs::exists(paths.temp));
  EXPECT_FALSE(fs::exists(paths.old));
}

// -----------------------------------------------------------------------------
// Failure between Swapped and Committed restores the previous content
// -----------------------------------------------------------------------------
TEST_F(ReplacerTest, PublishFailureRollsBackToPreviousContent) {
  h.fs.fail_renames.insert({paths.temp, original});

  ReplaceResult r = replacer.replace(original, candidate);

  EXPECT_EQ(r.state, ReplaceState::RolledBack);
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(ReadFile(original), "OLD-CONTENT");
  EXPECT_FALSE(fs::exists(paths.temp));
  EXPECT_FALSE(fs::exists(paths.old));
  EXPECT_TRUE(h.events.Has(EventType::RolledBack));
  EXPECT_FALSE(h.events.Has(EventType::OperatorAttention));
}

TEST_F(ReplacerTest, RollbackPublishesCandidateWhenPreviousContentIsStuck) {
  h.fs.fail_renames.insert({paths.temp, original});
  h.fs.fail_renames.insert({paths.old, original});

  ReplaceResult r = replacer.replace(original, candidate);

  // The path is never left empty: with .old unmovable the candidate is
  // published instead, and the previous content stays parked at .old.
  EXPECT_EQ(r.state, ReplaceState::RolledBack);
  EXPECT_EQ(ReadFile(original), "NEW");
  EXPECT_EQ(ReadFile(paths.old), "OLD-CONTENT");
  EXPECT_FALSE(fs::exists(paths.temp));
}

TEST_F(ReplacerTest, UnrecoverableRollbackNeedsOperator) {
  StuckFileSystem stuck;
  stuck.blocked_target = original;
  RunContext ctx{h.config, h.events, h.prober, h.encoder, h.copier, stuck};
  Replacer stuck_replacer(ctx);

  ReplaceResult r = stuck_replacer.replace(original, candidate);

  EXPECT_EQ(r.state, ReplaceState::Failed);
  EXPECT_FALSE(fs::exists(original));
  EXPECT_EQ(ReadFile(paths.old), "OLD-CONTENT");
  EXPECT_EQ(ReadFile(paths.temp), "NEW");
  EXPECT_TRUE(h.events.Has(EventType::OperatorAttention));
  EXPECT_TRUE(h.events.HasSeverity(Severity::Critical));
}

// -----------------------------------------------------------------------------
// Exchange mode
// -----------------------------------------------------------------------------
TEST_F(ReplacerTest, ExchangeModeSwapsAtomically) {
  h.config.atomic_exchange = true;
  h.fs.supports_exchange = true;

  ReplaceResult r = replacer.replace(original, candidate);

  EXPECT_TRUE(r.ok());
  EXPECT_TRUE(r.exchanged);
  EXPECT_EQ(ReadFile(original), "NEW");
  EXPECT_FALSE(fs::exists(paths.temp));
  EXPECT_FALSE(fs::exists(paths.old));
  EXPECT_EQ(h.fs.exchange_calls, 1);
}

TEST_F(ReplacerTest, UnsupportedExchangeFallsBackToTwoStep) {
  h.config.atomic_exchange = true;
  h.fs.supports_exchange = false;

  ReplaceResult r = replacer.replace(original, candidate);

  EXPECT_TRUE(r.ok());
  EXPECT_FALSE(r.exchanged);
  EXPECT_EQ(ReadFile(original), "NEW");
  EXPECT_EQ(h.fs.exchange_calls, 1);
}

TEST_F(ReplacerTest, ExchangeErrorAbortsWithoutTouchingOriginal) {
  h.config.atomic_exchange = true;
  h.fs.exchange_error = std::make_error_code(std::errc::permission_denied);

  ReplaceResult r = replacer.replace(original, candidate);

  EXPECT_EQ(r.state, ReplaceState::Failed);
  EXPECT_EQ(ReadFile(original), "OLD-CONTENT");
  EXPECT_FALSE(fs::exists(paths.temp));
}

} // namespace
} // namespace transcode_watchdog
