// Repository: LumenSync
// Component: Zone mixer unit tests
// Copyright (c) 2026 LumenSync

#include <gtest/gtest.h>

#include "lumensync/core/ZoneMixer.hpp"

namespace lumensync::core {
namespace {

ZoneFrame MakeFrame(std::vector<Rgb8> zones) {
  ZoneFrame frame;
  frame.zones = std::move(zones);
  return frame;
}

// -----------------------------------------------------------------------------
// wall_left draws from zones 0, 1 and 3; zone 2 must not leak in.
// -----------------------------------------------------------------------------
TEST(ZoneMixerTest, WallLeftAveragesItsZonesOnly) {
  const ZoneFrame frame = MakeFrame({{255, 0, 0}, {255, 0, 0}, {0, 255, 255}, {0, 0, 0}});
  const std::vector<Fixture> fixtures = {{"wall_left", 0, {0, 1, 3}}};

  auto mixed = ZoneMixer::Mix(frame, fixtures);
  ASSERT_EQ(mixed.size(), 1u);
  EXPECT_EQ(mixed[0].id, 0);
  EXPECT_NEAR(mixed[0].color.r, 170.0, 1e-9);
  EXPECT_NEAR(mixed[0].color.g, 0.0, 1e-9);
  EXPECT_NEAR(mixed[0].color.b, 0.0, 1e-9);
}

TEST(ZoneMixerTest, OneEntryPerFixtureInConfiguredOrder) {
  const ZoneFrame frame = MakeFrame({{10, 20, 30}, {30, 40, 50}, {200, 100, 0}});
  const std::vector<Fixture> fixtures = {
      {"right", 7, {2}},
      {"left", 3, {0, 1}},
      {"all", 5, {0, 1, 2}},
  };

  auto mixed = ZoneMixer::Mix(frame, fixtures);
  ASSERT_EQ(mixed.size(), 3u);
  EXPECT_EQ(mixed[0].id, 7);
  EXPECT_EQ(mixed[1].id, 3);
  EXPECT_EQ(mixed[2].id, 5);

  EXPECT_DOUBLE_EQ(mixed[0].color.r, 200.0);
  EXPECT_DOUBLE_EQ(mixed[1].color.g, 30.0);
  EXPECT_NEAR(mixed[2].color.r, 80.0, 1e-9);
  EXPECT_NEAR(mixed[2].color.g, 160.0 / 3.0, 1e-9);
  EXPECT_NEAR(mixed[2].color.b, 80.0 / 3.0, 1e-9);
}

TEST(ZoneMixerTest, SharedZonesFeedSeveralFixtures) {
  const ZoneFrame frame = MakeFrame({{100, 100, 100}, {0, 0, 0}});
  const std::vector<Fixture> fixtures = {{"a", 0, {0}}, {"b", 1, {0, 1}}};

  auto mixed = ZoneMixer::Mix(frame, fixtures);
  EXPECT_DOUBLE_EQ(mixed[0].color.r, 100.0);
  EXPECT_DOUBLE_EQ(mixed[1].color.r, 50.0);
}

TEST(ZoneMixerTest, RepeatedZoneWeighsTwice) {
  const ZoneFrame frame = MakeFrame({{90, 0, 0}, {0, 0, 0}});
  EXPECT_DOUBLE_EQ(ZoneMixer::Average(frame, {0, 0, 1}).r, 60.0);
}

TEST(ZoneMixerTest, EmptyZoneListAveragesToBlack) {
  const ZoneFrame frame = MakeFrame({{90, 90, 90}});
  RgbF avg = ZoneMixer::Average(frame, {});
  EXPECT_DOUBLE_EQ(avg.r, 0.0);
  EXPECT_DOUBLE_EQ(avg.g, 0.0);
  EXPECT_DOUBLE_EQ(avg.b, 0.0);
}

}  // namespace
}  // namespace lumensync::core
