#include <gtest/gtest.h>
#include <cmath>
#include "../src/core/statistics.hpp"

using namespace tradekit;

TEST(StatisticsTest, PctChanges) {
    auto r = stats::pct_changes({100.0, 110.0, 99.0});
    ASSERT_EQ(r.size(), 2u);
    EXPECT_NEAR(r[0], 0.10, 1e-12);
    EXPECT_NEAR(r[1], -0.10, 1e-12);
    EXPECT_TRUE(stats::pct_changes({5.0}).empty());
    EXPECT_TRUE(stats::pct_changes({}).empty());
}

TEST(StatisticsTest, PctChangeFromZeroIsZero) {
    auto r = stats::pct_changes({0.0, 10.0});
    ASSERT_EQ(r.size(), 1u);
    EXPECT_DOUBLE_EQ(r[0], 0.0);
}

TEST(StatisticsTest, SampleVariance) {
    EXPECT_DOUBLE_EQ(stats::mean({1.0, 2.0, 3.0, 4.0}), 2.5);
    EXPECT_NEAR(stats::variance_sample({1.0, 2.0, 3.0, 4.0}), 5.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats::variance_sample({7.0}), 0.0);
    EXPECT_DOUBLE_EQ(stats::stddev_sample({2.0, 2.0, 2.0}), 0.0);
}

TEST(StatisticsTest, MaxDrawdown) {
    EXPECT_DOUBLE_EQ(stats::max_drawdown({100.0, 50.0}), 0.5);
    EXPECT_NEAR(stats::max_drawdown({100.0, 120.0, 90.0, 130.0, 117.0}), 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(stats::max_drawdown({1.0, 2.0, 3.0}), 0.0);
    EXPECT_DOUBLE_EQ(stats::max_drawdown({}), 0.0);
}

TEST(StatisticsTest, ConstantSeriesHasNoChange) {
    auto r = stats::pct_changes({42.0, 42.0, 42.0, 42.0});
    ASSERT_EQ(r.size(), 3u);
    for (double v : r) EXPECT_DOUBLE_EQ(v, 0.0);
    EXPECT_DOUBLE_EQ(stats::stddev_sample({}), 0.0);
    EXPECT_DOUBLE_EQ(stats::stddev_sample({3.0}), 0.0);
}
