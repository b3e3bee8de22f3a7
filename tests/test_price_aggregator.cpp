#include <gtest/gtest.h>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <thread>
#include "pricefeed/price_aggregator.hpp"
#include "core/exceptions.hpp"
#include "mocks/mock_price_source.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

std::shared_ptr<NiceMock<neo::testing::MockPriceSource>> make_source(const std::string& name) {
    auto source = std::make_shared<NiceMock<neo::testing::MockPriceSource>>();
    ON_CALL(*source, name()).WillByDefault(Return(name));
    return source;
}

neo::PriceFeedConfig make_config(int min_valid_sources, double deviation_threshold = 0.1) {
    neo::PriceFeedConfig config;
    config.min_valid_sources = min_valid_sources;
    config.deviation_threshold = deviation_threshold;
    config.default_timeout_ms = 100;
    config.worker_count = 4;
    config.supported_symbols = {"NEO", "GAS", "X"};
    return config;
}

class PriceAggregatorTest : public ::testing::Test {
protected:
    std::shared_ptr<neo::PriceCache> cache = std::make_shared<neo::PriceCache>();
    std::shared_ptr<neo::MetricsRegistry> metrics = std::make_shared<neo::MetricsRegistry>();
};

} // namespace

TEST_F(PriceAggregatorTest, OutlierIsExcludedAndCycleSucceeds) {
    std::vector<neo::WeightedSource> sources;
    const double values[] = {10.0, 10.2, 9.9, 50.0};
    for (int i = 0; i < 4; ++i) {
        auto source = make_source("s" + std::to_string(i));
        EXPECT_CALL(*source, fetch_price("X", _)).WillOnce(Return(values[i]));
        sources.push_back({source, std::nullopt});
    }

    neo::PriceAggregator aggregator(make_config(3), sources, cache, metrics);
    auto result = aggregator.aggregate("X");

    ASSERT_TRUE(result.is_success());
    EXPECT_NEAR(result.value().value, (10.0 + 10.2 + 9.9) / 3.0, 1e-9);
    EXPECT_EQ(result.value().contributing_source_count, 3);

    neo::AggregatedPrice cached;
    ASSERT_TRUE(cache->get_price("X", cached));
    EXPECT_DOUBLE_EQ(cached.value, result.value().value);

    EXPECT_DOUBLE_EQ(metrics->counter("aggregation_outliers_rejected_total", {{"symbol", "X"}}), 1.0);
    EXPECT_DOUBLE_EQ(metrics->counter("aggregation_cycles_total", {{"symbol", "X"}, {"status", "success"}}), 1.0);
    EXPECT_DOUBLE_EQ(metrics->gauge("aggregation_source_success", {{"symbol", "X"}}), 4.0);
}

TEST_F(PriceAggregatorTest, TimeoutsCauseInsufficientQuorumAndKeepCachedValue) {
    cache->update(neo::AggregatedPrice{"X", 7.5, std::chrono::system_clock::now(), 3});

    auto fast = make_source("fast");
    EXPECT_CALL(*fast, fetch_price("X", _)).WillOnce(Return(10.0));

    auto slow_fetch = [](const std::string&, std::chrono::milliseconds) {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return 11.0;
    };
    auto slow1 = make_source("slow1");
    auto slow2 = make_source("slow2");
    EXPECT_CALL(*slow1, fetch_price("X", _)).WillOnce(Invoke(slow_fetch));
    EXPECT_CALL(*slow2, fetch_price("X", _)).WillOnce(Invoke(slow_fetch));

    neo::PriceAggregator aggregator(make_config(2), {{fast, std::nullopt}, {slow1, std::nullopt}, {slow2, std::nullopt}},
                                    cache, metrics);
    auto result = aggregator.aggregate("X");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), neo::ErrorCode::InsufficientQuorum);

    neo::AggregatedPrice cached;
    ASSERT_TRUE(cache->get_price("X", cached));
    EXPECT_DOUBLE_EQ(cached.value, 7.5);
    EXPECT_EQ(cached.contributing_source_count, 3);

    EXPECT_DOUBLE_EQ(metrics->counter("aggregation_source_failures_total", {{"symbol", "X"}, {"source", "slow1"}}), 1.0);
    EXPECT_DOUBLE_EQ(
        metrics->counter("aggregation_cycles_total", {{"symbol", "X"}, {"status", "insufficient_quorum"}}), 1.0);
}

TEST_F(PriceAggregatorTest, QuorumFailureWithoutPriorValueLeavesCacheEmpty) {
    auto ok = make_source("ok");
    auto broken = make_source("broken");
    EXPECT_CALL(*ok, fetch_price("NEO", _)).WillOnce(Return(12.0));
    EXPECT_CALL(*broken, fetch_price("NEO", _))
        .WillOnce(Throw(neo::SourceError(neo::ErrorCode::SourceFailure, "broken", "HTTP 500")));

    neo::PriceAggregator aggregator(make_config(2), {{ok, std::nullopt}, {broken, std::nullopt}}, cache, metrics);
    auto result = aggregator.aggregate("NEO");

    EXPECT_EQ(result.error_code(), neo::ErrorCode::InsufficientQuorum);
    neo::AggregatedPrice cached;
    EXPECT_FALSE(cache->get_price("NEO", cached));
}

TEST_F(PriceAggregatorTest, InvalidSampleValuesAreDiscarded) {
    auto zero = make_source("zero");
    auto nan = make_source("nan");
    auto good1 = make_source("good1");
    auto good2 = make_source("good2");
    EXPECT_CALL(*zero, fetch_price("GAS", _)).WillOnce(Return(0.0));
    EXPECT_CALL(*nan, fetch_price("GAS", _)).WillOnce(Return(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_CALL(*good1, fetch_price("GAS", _)).WillOnce(Return(4.0));
    EXPECT_CALL(*good2, fetch_price("GAS", _)).WillOnce(Return(4.2));

    neo::PriceAggregator aggregator(
        make_config(2), {{zero, std::nullopt}, {nan, std::nullopt}, {good1, std::nullopt}, {good2, std::nullopt}},
        cache, metrics);
    auto result = aggregator.aggregate("GAS");

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value().contributing_source_count, 2);
    EXPECT_NEAR(result.value().value, 4.1, 1e-9);
}

TEST_F(PriceAggregatorTest, ConfiguredWeightsOverrideDefault) {
    auto heavy = make_source("heavy");
    auto light = make_source("light");
    EXPECT_CALL(*heavy, fetch_price("NEO", _)).WillOnce(Return(10.0));
    EXPECT_CALL(*light, fetch_price("NEO", _)).WillOnce(Return(10.4));

    auto config = make_config(2);
    config.default_weight = 1.0;
    neo::PriceAggregator aggregator(config, {{heavy, 3.0}, {light, std::nullopt}}, cache, metrics);
    auto result = aggregator.aggregate("NEO");

    ASSERT_TRUE(result.is_success());
    EXPECT_NEAR(result.value().value, (10.0 * 3.0 + 10.4) / 4.0, 1e-9);
}

TEST_F(PriceAggregatorTest, UnsupportedSymbolIsRejectedBeforeFetching) {
    auto source = make_source("s");
    EXPECT_CALL(*source, fetch_price(_, _)).Times(0);

    neo::PriceAggregator aggregator(make_config(1), {{source, std::nullopt}}, cache, metrics);
    auto result = aggregator.aggregate("DOGE");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), neo::ErrorCode::UnsupportedSymbol);
}

TEST_F(PriceAggregatorTest, QueuedFetchesGetTheirFullTimeout) {
    auto config = make_config(3);
    config.worker_count = 1;

    std::vector<neo::WeightedSource> sources;
    for (const char* name : {"s1", "s2", "s3"}) {
        auto source = make_source(name);
        EXPECT_CALL(*source, fetch_price("X", _)).WillOnce(Invoke([](const std::string&, std::chrono::milliseconds) {
            std::this_thread::sleep_for(std::chrono::milliseconds(60));
            return 10.0;
        }));
        sources.push_back({source, std::nullopt});
    }

    neo::PriceAggregator aggregator(config, sources, cache, metrics);
    auto result = aggregator.aggregate("X");

    ASSERT_TRUE(result.is_success()) << result.error().message;
    EXPECT_EQ(result.value().contributing_source_count, 3);
    EXPECT_DOUBLE_EQ(metrics->counter("aggregation_source_failures_total", {{"symbol", "X"}, {"source", "s3"}}), 0.0);
}

TEST_F(PriceAggregatorTest, SourceWithoutNameIsRecordedAsFailure) {
    auto unnamed = std::make_shared<NiceMock<neo::testing::MockPriceSource>>();
    EXPECT_CALL(*unnamed, name()).WillOnce(Throw(std::runtime_error("no name")));
    EXPECT_CALL(*unnamed, fetch_price(_, _)).Times(0);
    auto good1 = make_source("good1");
    auto good2 = make_source("good2");
    EXPECT_CALL(*good1, fetch_price("NEO", _)).WillOnce(Return(12.0));
    EXPECT_CALL(*good2, fetch_price("NEO", _)).WillOnce(Return(12.0));

    neo::PriceAggregator aggregator(make_config(2), {{unnamed, std::nullopt}, {good1, std::nullopt}, {good2, std::nullopt}},
                                    cache, metrics);
    auto result = aggregator.aggregate("NEO");

    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value().contributing_source_count, 2);
    EXPECT_DOUBLE_EQ(metrics->counter("aggregation_source_failures_total", {{"symbol", "NEO"}, {"source", "<unnamed>"}}),
                     1.0);
}
