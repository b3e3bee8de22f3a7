#include <gtest/gtest.h>
#include <stdexcept>
#include "pricefeed/aggregation.hpp"

namespace {

std::vector<neo::PriceSample> samples_of(const std::vector<double>& values) {
    std::vector<neo::PriceSample> samples;
    for (size_t i = 0; i < values.size(); ++i) {
        samples.push_back(neo::PriceSample{"source" + std::to_string(i), values[i], 1.0});
    }
    return samples;
}

} // namespace

TEST(AggregationTest, MedianOfOddAndEvenSets) {
    EXPECT_DOUBLE_EQ(neo::median({3.0, 1.0, 2.0}), 2.0);
    EXPECT_DOUBLE_EQ(neo::median({10.0, 10.2, 9.9, 50.0}), 10.1);
    EXPECT_THROW(neo::median({}), std::invalid_argument);
}

TEST(AggregationTest, RelativeDeviationHandlesZeroReference) {
    EXPECT_DOUBLE_EQ(neo::relative_deviation(11.0, 10.0), 0.1);
    EXPECT_DOUBLE_EQ(neo::relative_deviation(9.0, 10.0), 0.1);
    EXPECT_DOUBLE_EQ(neo::relative_deviation(0.5, 0.0), 0.5);
}

TEST(AggregationTest, RejectsSamplesFarFromMedian) {
    auto split = neo::reject_outliers(samples_of({10.0, 10.2, 9.9, 50.0}), 0.1);

    ASSERT_EQ(split.accepted.size(), 3u);
    ASSERT_EQ(split.rejected.size(), 1u);
    EXPECT_DOUBLE_EQ(split.rejected[0].value, 50.0);
    EXPECT_DOUBLE_EQ(split.median, 10.1);
}

TEST(AggregationTest, ThresholdBoundaryIsInclusive) {
    // 11 sits exactly 10% above the median of 10
    auto split = neo::reject_outliers(samples_of({9.0, 10.0, 11.0}), 0.1);
    EXPECT_EQ(split.accepted.size(), 3u);
    EXPECT_TRUE(split.rejected.empty());
}

TEST(AggregationTest, NonPositiveThresholdDisablesFiltering) {
    auto split = neo::reject_outliers(samples_of({1.0, 100.0, 10000.0}), 0.0);
    EXPECT_EQ(split.accepted.size(), 3u);
    EXPECT_TRUE(split.rejected.empty());
}

TEST(AggregationTest, WeightedAverageFavoursHeavierSources) {
    std::vector<neo::PriceSample> samples = {
        {"a", 10.0, 3.0},
        {"b", 20.0, 1.0},
    };
    EXPECT_DOUBLE_EQ(neo::weighted_average(samples), 12.5);
}

TEST(AggregationTest, EqualWeightsGiveArithmeticMean) {
    EXPECT_NEAR(neo::weighted_average(samples_of({10.0, 10.2, 9.9})), 10.033333333, 1e-9);
}

TEST(AggregationTest, WeightedAverageRejectsDegenerateInput) {
    EXPECT_THROW(neo::weighted_average({}), std::invalid_argument);
    EXPECT_THROW(neo::weighted_average({{"a", 10.0, 0.0}}), std::invalid_argument);
}
