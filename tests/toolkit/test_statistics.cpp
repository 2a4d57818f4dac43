#include <gtest/gtest.h>
#include "hype/toolkit.hpp"

#include <cmath>
#include <vector>

using namespace hype::toolkit;

TEST(Statistics_Mean, KnownValue) {
    const std::vector<double> xs = {1.0, 2.0, 3.0, 4.0};
    ASSERT_TRUE(mean(xs).has_value());
    EXPECT_DOUBLE_EQ(*mean(xs), 2.5);
}

TEST(Statistics_Mean, Empty_Nullopt) {
    EXPECT_FALSE(mean(std::vector<double>{}).has_value());
}

TEST(Statistics_Stddev, PopulationDividesByN) {
    const std::vector<double> xs = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    ASSERT_TRUE(population_stddev(xs).has_value());
    EXPECT_DOUBLE_EQ(*population_stddev(xs), 2.0);
}

TEST(Statistics_Median, OddAndEven) {
    EXPECT_DOUBLE_EQ(*median(std::vector<double>{5.0, 1.0, 3.0}), 3.0);
    EXPECT_DOUBLE_EQ(*median(std::vector<double>{4.0, 1.0, 3.0, 2.0}), 2.5);
}

TEST(Statistics_Percentile, LinearInterpolation) {
    std::vector<double> xs;
    for (int i = 1; i <= 10; ++i) xs.push_back(static_cast<double>(i));
    // rank = 0.9 × 9 = 8.1 → 9 + 0.1 × (10 − 9)
    EXPECT_NEAR(*percentile(xs, 90.0), 9.1, 1e-12);
    EXPECT_DOUBLE_EQ(*percentile(xs, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(*percentile(xs, 100.0), 10.0);
}

TEST(Statistics_Percentile, OutOfRangeClamped_NaNRejected) {
    const std::vector<double> xs = {1.0, 2.0};
    EXPECT_DOUBLE_EQ(*percentile(xs, 150.0), 2.0);
    EXPECT_FALSE(percentile(xs, std::nan("")).has_value());
    EXPECT_FALSE(percentile(std::vector<double>{}, 50.0).has_value());
}

TEST(Statistics_Percent, ZeroWholeIsZero) {
    EXPECT_DOUBLE_EQ(percent(3.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(percent(1.0, 4.0), 25.0);
}
