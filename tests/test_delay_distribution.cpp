/// @file test_delay_distribution.cpp
/// @brief Unit tests for the simulated-delay sources.

#include "common/error.hpp"
#include "sim/delay_distribution.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace game_lb;
using namespace game_lb::sim;

TEST(DelayDistributionTest, UniformStaysInRange) {
  auto delay = UniformDelay::create(1.0, 3.0).value();
  EXPECT_DOUBLE_EQ(delay->min(), 1.0);
  EXPECT_DOUBLE_EQ(delay->max(), 3.0);
  for (int i = 0; i < 10000; ++i) {
    auto v = delay->sample();
    EXPECT_GE(v, 1.0);
    EXPECT_LE(v, 3.0);
  }
}

TEST(DelayDistributionTest, UniformDegenerateRangeIsConstant) {
  auto delay = UniformDelay::create(2.0, 2.0).value();
  EXPECT_DOUBLE_EQ(delay->sample(), 2.0);
}

TEST(DelayDistributionTest, InvalidRangesRejected) {
  EXPECT_EQ(UniformDelay::create(3.0, 1.0).error(), errc::invalid_delay_range);
  EXPECT_EQ(UniformDelay::create(-1.0, 1.0).error(),
            errc::invalid_delay_range);
  EXPECT_EQ(UniformDelay::create(0.0, std::numeric_limits<double>::infinity())
                .error(),
            errc::invalid_delay_range);
  EXPECT_FALSE(make_delay_distribution(
                   std::numeric_limits<double>::quiet_NaN(), 1.0)
                   .has_value());
}

TEST(DelayDistributionTest, FixedReturnsValue) {
  FixedDelay delay{1.25};
  EXPECT_DOUBLE_EQ(delay.sample(), 1.25);
  EXPECT_DOUBLE_EQ(delay.sample(), 1.25);
}

TEST(DelayDistributionTest, FactoryPicksFixedForEqualBounds) {
  auto fixed = make_delay_distribution(1.0, 1.0);
  ASSERT_TRUE(fixed.has_value());
  EXPECT_NE(dynamic_cast<FixedDelay *>(fixed->get()), nullptr);

  auto uniform = make_delay_distribution(1.0, 3.0);
  ASSERT_TRUE(uniform.has_value());
  EXPECT_NE(dynamic_cast<UniformDelay *>(uniform->get()), nullptr);
}

TEST(DelayDistributionTest, ZeroDelayAllowed) {
  auto delay = make_delay_distribution(0.0, 0.0);
  ASSERT_TRUE(delay.has_value());
  EXPECT_DOUBLE_EQ((*delay)->sample(), 0.0);
}
