#include <gtest/gtest.h>
#include <csignal>
#include "core/app_state.hpp"
#include "core/trigger_registry.hpp"
#include "core/types.hpp"
#include "utils/metrics.hpp"

TEST(TypesTest, TriggerTypeNames) {
    EXPECT_STREQ(neo::to_string(neo::TriggerType::Schedule), "schedule");
    EXPECT_STREQ(neo::to_string(neo::TriggerType::PriceAlert), "price_alert");
    EXPECT_EQ(neo::parse_trigger_type("price_alert"), neo::TriggerType::PriceAlert);
    EXPECT_FALSE(neo::parse_trigger_type("price").has_value());
    EXPECT_FALSE(neo::parse_trigger_type("cron").has_value());
    EXPECT_FALSE(neo::parse_trigger_type("Schedule").has_value());
}

TEST(TypesTest, TriggerSerializesItsCondition) {
    neo::TriggerRegistry registry;
    neo::TriggerDefinition definition;
    definition.id = "neo-high";
    definition.owner_id = "alice";
    definition.type = "price_alert";
    definition.condition = "NEO above 10.5";
    definition.function_id = "notify";
    definition.parameters = {{"channel", "ops"}};

    auto j = neo::to_json(registry.create(definition));
    EXPECT_EQ(j.at("id"), "neo-high");
    EXPECT_EQ(j.at("type"), "price_alert");
    EXPECT_EQ(j.at("condition"), "NEO above 10.5");
    EXPECT_EQ(j.at("parameters").at("channel"), "ops");
    EXPECT_FALSE(j.contains("schedule"));
}

TEST(TypesTest, AggregatedPriceSerializesEpochMillis) {
    neo::AggregatedPrice price{"GAS", 4.5, neo::SystemTime(std::chrono::milliseconds(1700000000123)), 3};
    auto j = neo::to_json(price);
    EXPECT_EQ(j.at("computed_at"), 1700000000123LL);
    EXPECT_EQ(j.at("contributing_source_count"), 3);
}

TEST(MetricsRegistryTest, LabelsDistinguishSeries) {
    neo::MetricsRegistry metrics;
    metrics.increment_counter("dispatch_total", {{"status", "queued"}});
    metrics.increment_counter("dispatch_total", {{"status", "queued"}}, 2.0);
    metrics.increment_counter("dispatch_total", {{"status", "failed"}});
    metrics.set_gauge("aggregation_price", 10.5, {{"symbol", "NEO"}});

    EXPECT_DOUBLE_EQ(metrics.counter("dispatch_total", {{"status", "queued"}}), 3.0);
    EXPECT_DOUBLE_EQ(metrics.counter("dispatch_total", {{"status", "failed"}}), 1.0);
    EXPECT_DOUBLE_EQ(metrics.counter("dispatch_total"), 0.0);

    auto snapshot = metrics.snapshot();
    EXPECT_DOUBLE_EQ(snapshot.at("gauges").at("aggregation_price{symbol=\"NEO\"}").get<double>(), 10.5);

    metrics.reset();
    EXPECT_DOUBLE_EQ(metrics.gauge("aggregation_price", {{"symbol", "NEO"}}), 0.0);
}

TEST(AppStateTest, FirstShutdownSignalWins) {
    neo::AppState state;
    EXPECT_TRUE(state.is_running());
    EXPECT_EQ(state.shutdown_signal(), 0);

    state.shutdown(SIGTERM);
    state.shutdown(SIGINT);
    EXPECT_FALSE(state.is_running());
    EXPECT_EQ(state.shutdown_signal(), SIGTERM);
}
