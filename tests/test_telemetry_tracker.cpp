#include <gtest/gtest.h>

#include "generation_events.hpp"
#include "telemetry_tracker.hpp"
#include "test_support.hpp"

#include <limits>

using namespace chatgen;
using chatgen::fakes::FakeClock;

class TelemetryTrackerTest : public ::testing::Test {
 protected:
  FakeClock clock;
  TelemetryTracker tracker{&clock};

  void Emit(StreamEventKind kind) {
    StreamEvent ev;
    ev.kind = kind;
    ev.text = "x";
    tracker.OnEvent(ev);
  }
};

TEST_F(TelemetryTrackerTest, GeneratedTokenCountPrefersReasoningSplit) {
  TokenUsage u;
  u.input_tokens = 100;
  u.output_tokens = 40;
  u.reasoning_tokens = 60;
  u.total_tokens = 200;
  EXPECT_EQ(GeneratedTokenCount(u), 100);

  u.reasoning_tokens = 0;
  EXPECT_EQ(GeneratedTokenCount(u), 100);

  u.total_tokens = 0;
  EXPECT_EQ(GeneratedTokenCount(u), 40);
}

TEST_F(TelemetryTrackerTest, RecordsFirstChunkAndFirstReasoningOnce) {
  tracker.MarkRequestStart();
  clock.Advance(std::chrono::milliseconds(300));
  Emit(StreamEventKind::kTextDelta);
  const auto first = *tracker.timings().first_chunk;
  clock.Advance(std::chrono::milliseconds(100));
  Emit(StreamEventKind::kReasoningDelta);
  clock.Advance(std::chrono::milliseconds(100));
  Emit(StreamEventKind::kReasoningDelta);

  EXPECT_EQ(*tracker.timings().first_chunk, first);
  EXPECT_EQ(*tracker.timings().first_reasoning - first, std::chrono::milliseconds(100));
}

TEST_F(TelemetryTrackerTest, FinishAndErrorDoNotCountAsChunks) {
  tracker.MarkRequestStart();
  Emit(StreamEventKind::kFinish);
  Emit(StreamEventKind::kError);
  EXPECT_FALSE(tracker.timings().first_chunk.has_value());
}

TEST_F(TelemetryTrackerTest, TokensPerSecondFromFirstReasoning) {
  tracker.MarkRequestStart();
  clock.Advance(std::chrono::milliseconds(500));
  Emit(StreamEventKind::kReasoningDelta);
  clock.Advance(std::chrono::seconds(2));
  Emit(StreamEventKind::kTextDelta);
  tracker.MarkEnd();

  TokenUsage u;
  u.output_tokens = 30;
  u.reasoning_tokens = 20;
  auto tps = tracker.TokensPerSecond(u);
  ASSERT_TRUE(tps.has_value());
  EXPECT_DOUBLE_EQ(*tps, 25.0);
}

TEST_F(TelemetryTrackerTest, NoDeltasMeansNoRate) {
  tracker.MarkRequestStart();
  clock.Advance(std::chrono::seconds(1));
  tracker.MarkEnd();
  TokenUsage u;
  u.output_tokens = 10;
  EXPECT_FALSE(tracker.TokensPerSecond(u).has_value());
}

TEST_F(TelemetryTrackerTest, ZeroDurationOrTokensMeansNoRate) {
  tracker.MarkRequestStart();
  Emit(StreamEventKind::kTextDelta);
  tracker.MarkEnd();
  TokenUsage u;
  u.output_tokens = 10;
  EXPECT_FALSE(tracker.TokensPerSecond(u).has_value());

  GenerationTimings t;
  t.first_chunk = clock.Now();
  t.end = clock.Now() + std::chrono::seconds(1);
  EXPECT_FALSE(ComputeTokensPerSecond(t, TokenUsage{}).has_value());
}

TEST_F(TelemetryTrackerTest, RoundingDropsZeroAndNonFinite) {
  EXPECT_DOUBLE_EQ(*RoundTokensPerSecond(12.345), 12.3);
  EXPECT_DOUBLE_EQ(*RoundTokensPerSecond(0.06), 0.1);
  EXPECT_FALSE(RoundTokensPerSecond(0.04).has_value());
  EXPECT_FALSE(RoundTokensPerSecond(std::nullopt).has_value());
  EXPECT_FALSE(RoundTokensPerSecond(std::numeric_limits<double>::infinity()).has_value());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
