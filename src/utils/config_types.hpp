#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace neo {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name = "neo-oracle";
    std::string version = "1.0.0";
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AppConfig, name, version, log_level)

struct LoggingConfig {
    std::string file_path = "logs/neo-oracle.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
    bool file_output = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LoggingConfig, file_path, max_file_size_mb, max_backup_files, console_output, file_output)

struct SourceConfig {
    std::string name;
    std::optional<double> weight; // unset -> PriceFeedConfig::default_weight
    std::string endpoint;         // may contain {symbol} / {symbol_lower}
    std::string price_path = "/price";
    std::map<std::string, std::string> headers;
};

void to_json(nlohmann::json& j, const SourceConfig& source);
void from_json(const nlohmann::json& j, SourceConfig& source);

struct PriceFeedConfig {
    int min_update_interval_ms = 5000;
    int max_update_interval_ms = 300000;
    int update_interval_ms = 60000;
    int max_price_feeds = 50;
    int min_valid_sources = 3;
    int default_timeout_ms = 5000;
    double default_weight = 1.0;
    int worker_count = 8;
    double deviation_threshold = 0.05;
    std::vector<std::string> supported_symbols = {"NEO", "GAS", "ETH", "BTC"};
    std::vector<std::string> tracked_symbols;
    std::vector<SourceConfig> sources;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PriceFeedConfig, min_update_interval_ms, max_update_interval_ms,
    update_interval_ms, max_price_feeds, min_valid_sources, default_timeout_ms, default_weight, worker_count,
    deviation_threshold, supported_symbols, tracked_symbols, sources)

struct AutomationConfig {
    int monitor_interval_ms = 60000;
    int schedule_tick_ms = 1000;
    std::string schedule_timezone = "local";
    int dispatch_workers = 4;
    int dispatch_queue_size = 1024;
    int max_triggers_per_owner = 100;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AutomationConfig, monitor_interval_ms, schedule_tick_ms,
    schedule_timezone, dispatch_workers, dispatch_queue_size, max_triggers_per_owner)

struct FunctionExecutorConfig {
    std::string endpoint = "http://localhost:8081";
    int timeout_ms = 30000;
    std::string api_key;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(FunctionExecutorConfig, endpoint, timeout_ms, api_key)

// Trigger as written in the configuration file, before validation
struct TriggerConfig {
    std::string id;
    std::string owner_id;
    std::string type;
    std::string schedule;
    std::string condition;
    std::string function_id;
    nlohmann::json parameters = nlohmann::json::object();
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TriggerConfig, id, owner_id, type, schedule, condition, function_id, parameters)

} // namespace neo
