// Repository: LumenSync
// Component: Smoothing filter unit tests
// Copyright (c) 2026 LumenSync

#include <gtest/gtest.h>

#include <stdexcept>

#include "lumensync/core/SmoothingFilter.hpp"

namespace lumensync::core {
namespace {

const std::vector<Fixture> kFixtures = {{"left", 0, {0}}, {"right", 1, {1}}};

FixtureColor Color(FixtureId id, double r, double g, double b) {
  return FixtureColor{id, RgbF{r, g, b}};
}

TEST(SmoothingFilterTest, FirstValuePassesThrough) {
  SmoothingFilter filter(kFixtures, 0.8);
  EXPECT_FALSE(filter.Previous(0).has_value());

  FixtureColor out = filter.Apply(Color(0, 200, 100, 50));
  EXPECT_DOUBLE_EQ(out.color.r, 200.0);
  EXPECT_DOUBLE_EQ(out.color.g, 100.0);
  EXPECT_DOUBLE_EQ(out.color.b, 50.0);
  ASSERT_TRUE(filter.Previous(0).has_value());
  EXPECT_DOUBLE_EQ(filter.Previous(0)->r, 200.0);
}

TEST(SmoothingFilterTest, AlphaZeroIsIdentity) {
  SmoothingFilter filter(kFixtures, 0.0);
  filter.Apply(Color(0, 255, 255, 255));
  FixtureColor out = filter.Apply(Color(0, 10, 20, 30));
  EXPECT_DOUBLE_EQ(out.color.r, 10.0);
  EXPECT_DOUBLE_EQ(out.color.g, 20.0);
  EXPECT_DOUBLE_EQ(out.color.b, 30.0);
}

TEST(SmoothingFilterTest, BlendsWithPreviousOutput) {
  SmoothingFilter filter(kFixtures, 0.5);
  filter.Apply(Color(0, 100, 0, 0));
  FixtureColor second = filter.Apply(Color(0, 200, 0, 0));
  EXPECT_DOUBLE_EQ(second.color.r, 150.0);
  FixtureColor third = filter.Apply(Color(0, 200, 0, 0));
  EXPECT_DOUBLE_EQ(third.color.r, 175.0);
}

TEST(SmoothingFilterTest, ConstantInputConverges) {
  SmoothingFilter filter(kFixtures, SmoothingFilter::kMaxAlpha);
  filter.Apply(Color(1, 0, 0, 0));
  FixtureColor out{};
  for (int i = 0; i < 600; ++i) {
    out = filter.Apply(Color(1, 120, 60, 30));
  }
  EXPECT_NEAR(out.color.r, 120.0, 0.01);
  EXPECT_NEAR(out.color.g, 60.0, 0.01);
  EXPECT_NEAR(out.color.b, 30.0, 0.01);
}

TEST(SmoothingFilterTest, FixturesAreIndependent) {
  SmoothingFilter filter(kFixtures, 0.5);
  filter.Apply(Color(0, 100, 0, 0));
  FixtureColor right = filter.Apply(Color(1, 40, 0, 0));
  EXPECT_DOUBLE_EQ(right.color.r, 40.0);
  EXPECT_DOUBLE_EQ(filter.Previous(0)->r, 100.0);
}

TEST(SmoothingFilterTest, RejectsAlphaOutsideRange) {
  EXPECT_THROW(SmoothingFilter(kFixtures, -0.1), std::invalid_argument);
  EXPECT_THROW(SmoothingFilter(kFixtures, 0.96), std::invalid_argument);
  EXPECT_NO_THROW(SmoothingFilter(kFixtures, 0.95));
}

TEST(SmoothingFilterTest, UnknownFixtureIsAProgrammingError) {
  SmoothingFilter filter(kFixtures, 0.3);
  EXPECT_THROW(filter.Apply(Color(9, 1, 1, 1)), std::logic_error);
}

}  // namespace
}  // namespace lumensync::core
