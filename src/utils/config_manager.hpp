#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace neo {

class ConfigManager {
public:
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& content);

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    PriceFeedConfig& get_price_feed_config();
    AutomationConfig& get_automation_config();
    FunctionExecutorConfig& get_function_executor_config();
    std::vector<TriggerConfig>& get_trigger_configs();

private:
    bool apply(const nlohmann::json& data);

    nlohmann::json config_data_; // Keep for initial parsing
    AppConfig app_config_;
    LoggingConfig logging_config_;
    PriceFeedConfig price_feed_config_;
    AutomationConfig automation_config_;
    FunctionExecutorConfig function_executor_config_;
    std::vector<TriggerConfig> trigger_configs_;
};

} // namespace neo
