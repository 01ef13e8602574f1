/// @file percentile_test.cpp
/// @brief Tests for nearest-rank percentiles and means

#include <gtest/gtest.h>

#include <vector>

#include "analytics/percentile.h"

namespace pglogstats {
namespace {

using analytics::Mean;
using analytics::NearestRankPercentile;

std::vector<double> OneToHundred() {
    std::vector<double> values;
    for (int i = 1; i <= 100; ++i) {
        values.push_back(i);
    }
    return values;
}

TEST(PercentileTest, NearestRankOnOneToHundred) {
    const auto values = OneToHundred();
    EXPECT_DOUBLE_EQ(NearestRankPercentile(values, 50.0), 50.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(values, 95.0), 95.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(values, 99.0), 99.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(values, 100.0), 100.0);
}

TEST(PercentileTest, RankIsExactForWholeRanks) {
    const auto hundred = OneToHundred();
    EXPECT_DOUBLE_EQ(NearestRankPercentile(hundred, 7.0), 7.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(hundred, 14.0), 14.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(hundred, 28.0), 28.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(hundred, 55.0), 55.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(hundred, 81.0), 81.0);

    const std::vector<double> fifty(hundred.begin(), hundred.begin() + 50);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(fifty, 14.0), 7.0);
    EXPECT_DOUBLE_EQ(NearestRankPercentile(fifty, 34.0), 17.0);
}

TEST(PercentileTest, EveryWholePercentileOnOneToHundred) {
    const auto values = OneToHundred();
    for (int p = 1; p <= 100; ++p) {
        EXPECT_DOUBLE_EQ(NearestRankPercentile(values, p), p) << "p" << p;
    }
}

TEST(PercentileTest, ZeroPercentileClampsToMinimum) {
    EXPECT_DOUBLE_EQ(NearestRankPercentile({3.0, 7.0, 9.0}, 0.0), 3.0);
}

TEST(PercentileTest, SmallSamples) {
    EXPECT_DOUBLE_EQ(NearestRankPercentile({42.0}, 95.0), 42.0);
    // ceil(0.95 * 3) - 1 = 2
    EXPECT_DOUBLE_EQ(NearestRankPercentile({1.0, 2.0, 3.0}, 95.0), 3.0);
    // ceil(0.5 * 4) - 1 = 1
    EXPECT_DOUBLE_EQ(NearestRankPercentile({1.0, 2.0, 3.0, 4.0}, 50.0), 2.0);
}

TEST(PercentileTest, EmptySampleIsZero) {
    EXPECT_DOUBLE_EQ(NearestRankPercentile({}, 95.0), 0.0);
    EXPECT_DOUBLE_EQ(Mean({}), 0.0);
}

TEST(PercentileTest, Mean) {
    EXPECT_DOUBLE_EQ(Mean({10.0, 20.0, 30.0}), 20.0);
    EXPECT_DOUBLE_EQ(Mean({0.5}), 0.5);
}

}  // namespace
}  // namespace pglogstats
