// Repository: LumenSync
// Component: Color sample source unit tests
// Copyright (c) 2026 LumenSync

#include <gtest/gtest.h>

#include "fixtures/FakeTvDevice.hpp"
#include "lumensync/core/ColorSampleSource.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace lumensync::core {
namespace {

using tests::DeterministicTimeSource;
using tests::fixtures::FakeTvDevice;

ZoneFrame Uniform(size_t n, uint8_t v) {
  ZoneFrame frame;
  frame.zones.assign(n, Rgb8{v, v, v});
  return frame;
}

class ColorSampleSourceTest : public ::testing::Test {
 protected:
  ColorSampleSourceTest()
      : clock_(5000), source_(tv_, clock_, std::chrono::milliseconds(200), 4) {}

  FakeTvDevice tv_;
  DeterministicTimeSource clock_;
  TvColorSampleSource source_;
};

TEST_F(ColorSampleSourceTest, SuccessfulFetchIsStampedWithCaptureTime) {
  tv_.QueueFrame(tv::TvFrameResult::Success(Uniform(4, 80)));
  SampleResult result = source_.Sample();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.frame.size(), 4u);
  EXPECT_EQ(result.frame.captured_at_ms, 5000);
  EXPECT_EQ(tv_.last_timeout(), std::chrono::milliseconds(200));
}

TEST_F(ColorSampleSourceTest, UnreachableStaysUnreachable) {
  tv_.QueueFrame(tv::TvFrameResult::Failure(tv::TvErrorKind::kUnreachable, "refused"));
  SampleResult result = source_.Sample();
  EXPECT_EQ(result.outcome, SampleOutcome::kUnreachable);
  EXPECT_NE(result.detail.find("refused"), std::string::npos);
}

TEST_F(ColorSampleSourceTest, TimeoutAndBadPayloadAreTransient) {
  tv_.QueueFrame(tv::TvFrameResult::Failure(tv::TvErrorKind::kTimeout, "200ms"));
  tv_.QueueFrame(tv::TvFrameResult::Failure(tv::TvErrorKind::kMalformed, "not json"));
  tv_.QueueFrame(tv::TvFrameResult::Failure(tv::TvErrorKind::kHttpStatus, "503", 503));
  EXPECT_EQ(source_.Sample().outcome, SampleOutcome::kTransient);
  EXPECT_EQ(source_.Sample().outcome, SampleOutcome::kTransient);
  EXPECT_EQ(source_.Sample().outcome, SampleOutcome::kTransient);
}

TEST_F(ColorSampleSourceTest, ZoneCountMismatchIsTransient) {
  tv_.QueueFrame(tv::TvFrameResult::Success(Uniform(3, 80)));
  SampleResult result = source_.Sample();
  EXPECT_EQ(result.outcome, SampleOutcome::kTransient);
  EXPECT_NE(result.detail.find("zone count mismatch"), std::string::npos);
}

TEST_F(ColorSampleSourceTest, BlackScreenAtAndAboveThreshold) {
  EXPECT_TRUE(source_.IsBlackScreen(Uniform(4, 0)));
  EXPECT_TRUE(source_.IsBlackScreen(Uniform(4, 15)));
  EXPECT_FALSE(source_.IsBlackScreen(Uniform(4, 16)));

  ZoneFrame one_lit = Uniform(4, 0);
  one_lit.zones[2].b = 16;
  EXPECT_FALSE(source_.IsBlackScreen(one_lit));
}

TEST_F(ColorSampleSourceTest, EmptyFrameCountsAsBlack) {
  EXPECT_TRUE(IsFrameBelowThreshold(ZoneFrame{}, 0));
}

TEST_F(ColorSampleSourceTest, PowerStateOnlyWhenSupported) {
  EXPECT_FALSE(source_.PowerState().has_value());
  EXPECT_EQ(tv_.power_calls(), 0);

  tv_.SetPowerState(true, tv::TvPowerStateResult{true, "Standby", {}});
  auto state = source_.PowerState();
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(*state, "Standby");

  tv_.SetPowerState(true, tv::TvPowerStateResult{false, "", {tv::TvErrorKind::kTimeout, 0, ""}});
  EXPECT_FALSE(source_.PowerState().has_value());
}

}  // namespace
}  // namespace lumensync::core
