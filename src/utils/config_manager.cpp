#include "config_manager.hpp"
#include <fstream>
#include "logger.hpp"

namespace neo {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        NEO_LOG_ERROR("Failed to open config file: {}", file_path);
        return false;
    }

    nlohmann::json data;
    try {
        file >> data;
    } catch (const nlohmann::json::exception& e) {
        NEO_LOG_ERROR("Error parsing config file {}: {}", file_path, e.what());
        return false;
    }
    return apply(data);
}

bool ConfigManager::load_from_string(const std::string& content) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        NEO_LOG_ERROR("Error parsing config: {}", e.what());
        return false;
    }
    return apply(data);
}

bool ConfigManager::apply(const nlohmann::json& data) {
    if (!data.is_object()) {
        NEO_LOG_ERROR("Config root must be a JSON object");
        return false;
    }

    // Parse into temporaries so a failed load leaves the previous values in place
    AppConfig app;
    LoggingConfig logging;
    PriceFeedConfig price_feed;
    AutomationConfig automation;
    FunctionExecutorConfig function_executor;
    std::vector<TriggerConfig> triggers;

    try {
        if (data.contains("app")) {
            data["app"].get_to(app);
        }
        if (data.contains("logging")) {
            data["logging"].get_to(logging);
        }
        if (data.contains("price_feed")) {
            data["price_feed"].get_to(price_feed);
        }
        if (data.contains("automation")) {
            data["automation"].get_to(automation);
        }
        if (data.contains("function_executor")) {
            data["function_executor"].get_to(function_executor);
        }
        if (data.contains("triggers")) {
            data["triggers"].get_to(triggers);
        }
    } catch (const nlohmann::json::exception& e) {
        NEO_LOG_ERROR("Error parsing config: {}", e.what());
        return false;
    }

    // Secrets may come from the environment instead of the file
    if (function_executor.api_key.empty()) {
        function_executor.api_key = get_env_var("NEO_FUNCTION_EXECUTOR_API_KEY");
    }

    config_data_ = data;
    app_config_ = std::move(app);
    logging_config_ = std::move(logging);
    price_feed_config_ = std::move(price_feed);
    automation_config_ = std::move(automation);
    function_executor_config_ = std::move(function_executor);
    trigger_configs_ = std::move(triggers);
    return true;
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

PriceFeedConfig& ConfigManager::get_price_feed_config() {
    return price_feed_config_;
}

AutomationConfig& ConfigManager::get_automation_config() {
    return automation_config_;
}

FunctionExecutorConfig& ConfigManager::get_function_executor_config() {
    return function_executor_config_;
}

std::vector<TriggerConfig>& ConfigManager::get_trigger_configs() {
    return trigger_configs_;
}

} // namespace neo
