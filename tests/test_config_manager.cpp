#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "utils/config_manager.hpp"
#include "utils/config_validator.hpp"

namespace {

const char* kValidConfig = R"({
    "app": {"name": "neo-oracle-test", "log_level": "debug"},
    "price_feed": {
        "min_valid_sources": 2,
        "deviation_threshold": 0.1,
        "supported_symbols": ["NEO", "GAS"],
        "tracked_symbols": ["NEO"],
        "sources": [
            {"name": "binance", "endpoint": "https://api.example.com/{symbol}", "price_path": "/price", "weight": 2.0},
            {"name": "coinbase", "endpoint": "https://cb.example.com/{symbol_lower}"}
        ]
    },
    "automation": {"schedule_timezone": "utc", "max_triggers_per_owner": 5},
    "function_executor": {"endpoint": "http://localhost:9000", "api_key": "secret"},
    "triggers": [
        {"id": "gas-low", "owner_id": "ops", "type": "price_alert", "condition": "GAS below 5", "function_id": "notify"}
    ]
})";

} // namespace

TEST(ConfigManagerTest, LoadsAllSections) {
    neo::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(kValidConfig));

    EXPECT_EQ(config.get_app_config().name, "neo-oracle-test");
    EXPECT_EQ(config.get_app_config().log_level, "debug");

    const auto& feed = config.get_price_feed_config();
    EXPECT_EQ(feed.min_valid_sources, 2);
    EXPECT_DOUBLE_EQ(feed.deviation_threshold, 0.1);
    ASSERT_EQ(feed.sources.size(), 2u);
    ASSERT_TRUE(feed.sources[0].weight.has_value());
    EXPECT_DOUBLE_EQ(*feed.sources[0].weight, 2.0);
    EXPECT_FALSE(feed.sources[1].weight.has_value());
    EXPECT_EQ(feed.sources[1].price_path, "/price");

    EXPECT_EQ(config.get_automation_config().schedule_timezone, "utc");
    EXPECT_EQ(config.get_automation_config().max_triggers_per_owner, 5);
    EXPECT_EQ(config.get_function_executor_config().api_key, "secret");

    ASSERT_EQ(config.get_trigger_configs().size(), 1u);
    EXPECT_EQ(config.get_trigger_configs()[0].condition, "GAS below 5");
}

TEST(ConfigManagerTest, MissingSectionsKeepDefaults) {
    neo::ConfigManager config;
    ASSERT_TRUE(config.load_from_string("{}"));

    const auto& feed = config.get_price_feed_config();
    EXPECT_EQ(feed.min_valid_sources, 3);
    EXPECT_EQ(feed.max_price_feeds, 50);
    EXPECT_EQ(feed.supported_symbols, (std::vector<std::string>{"NEO", "GAS", "ETH", "BTC"}));
    EXPECT_EQ(config.get_automation_config().monitor_interval_ms, 60000);
    EXPECT_TRUE(config.get_trigger_configs().empty());
}

TEST(ConfigManagerTest, MalformedInputLeavesPreviousValues) {
    neo::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(kValidConfig));

    EXPECT_FALSE(config.load_from_string("{not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2]"));
    EXPECT_FALSE(config.load_from_string(R"({"price_feed": {"min_valid_sources": "three"}})"));

    EXPECT_EQ(config.get_app_config().name, "neo-oracle-test");
    EXPECT_EQ(config.get_price_feed_config().min_valid_sources, 2);
}

TEST(ConfigManagerTest, MissingFileFailsToLoad) {
    neo::ConfigManager config;
    EXPECT_FALSE(config.load("/nonexistent/neo-oracle/settings.json"));
}

TEST(ConfigManagerTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "neo_oracle_config_test.json";
    {
        std::ofstream file(path);
        file << kValidConfig;
    }

    neo::ConfigManager config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get_price_feed_config().tracked_symbols, (std::vector<std::string>{"NEO"}));
    std::remove(path.c_str());
}

TEST(ConfigManagerTest, ApiKeyFallsBackToEnvironment) {
    setenv("NEO_FUNCTION_EXECUTOR_API_KEY", "from-env", 1);
    neo::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(R"({"function_executor": {"endpoint": "http://localhost:1"}})"));
    EXPECT_EQ(config.get_function_executor_config().api_key, "from-env");
    unsetenv("NEO_FUNCTION_EXECUTOR_API_KEY");
}

TEST(ConfigValidatorTest, ValidConfigPasses) {
    neo::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(kValidConfig));

    neo::ConfigValidator validator;
    auto result = validator.validate(config);
    EXPECT_TRUE(result.is_success()) << result.error().message;
    EXPECT_TRUE(validator.get_errors().empty());
}

TEST(ConfigValidatorTest, CollectsEveryViolation) {
    neo::ConfigManager config;
    ASSERT_TRUE(config.load_from_string(R"({
        "price_feed": {
            "min_valid_sources": 0,
            "min_update_interval_ms": 1000,
            "max_update_interval_ms": 500,
            "supported_symbols": ["NEO"],
            "tracked_symbols": ["DOGE"],
            "sources": [
                {"name": "a", "endpoint": "https://a"},
                {"name": "a", "endpoint": ""}
            ]
        },
        "automation": {"schedule_timezone": "mars"},
        "function_executor": {"endpoint": "ftp://nowhere"}
    })"));

    neo::ConfigValidator validator;
    auto result = validator.validate(config);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), neo::ErrorCode::Configuration);

    std::vector<std::string> fields;
    for (const auto& error : validator.get_errors()) {
        fields.push_back(error.field);
    }
    auto has = [&fields](const std::string& field) {
        return std::find(fields.begin(), fields.end(), field) != fields.end();
    };
    EXPECT_TRUE(has("price_feed.min_valid_sources"));
    EXPECT_TRUE(has("price_feed.max_update_interval_ms"));
    EXPECT_TRUE(has("price_feed.tracked_symbols"));
    EXPECT_TRUE(has("price_feed.sources[1].name"));
    EXPECT_TRUE(has("price_feed.sources[1].endpoint"));
    EXPECT_TRUE(has("automation.schedule_timezone"));
    EXPECT_TRUE(has("function_executor.endpoint"));
}

TEST(ConfigValidatorTest, SectionValidatorsReportIndependently) {
    neo::ConfigValidator validator;
    neo::AutomationConfig automation;
    automation.dispatch_workers = 0;

    EXPECT_TRUE(validator.validate_logging_config(neo::LoggingConfig{}).is_success());
    EXPECT_TRUE(validator.validate_automation_config(automation).is_error());
    EXPECT_EQ(validator.get_errors().size(), 1u);

    validator.clear_errors();
    EXPECT_TRUE(validator.get_errors().empty());
}
