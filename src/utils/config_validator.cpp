#include "config_validator.hpp"
#include "config_manager.hpp"
#include "logger.hpp"
#include <algorithm>
#include <set>

namespace neo {

ConfigValidator::ValidationResult ConfigValidator::validate(ConfigManager& config) {
    clear_errors();

    validate_logging_config(config.get_logging_config());
    validate_price_feed_config(config.get_price_feed_config());
    validate_automation_config(config.get_automation_config());
    validate_function_executor_config(config.get_function_executor_config());

    for (const auto& error : errors_) {
        NEO_LOG_ERROR("Config error in {}: {}{}", error.field, error.message,
                      error.value.empty() ? "" : " (got '" + error.value + "')");
    }
    return make_result("configuration");
}

ConfigValidator::ValidationResult ConfigValidator::validate_logging_config(const LoggingConfig& logging) {
    size_t before = errors_.size();

    if (logging.file_output && logging.file_path.empty()) {
        add_error("logging.file_path", "must be set when file_output is enabled");
    }
    if (logging.max_file_size_mb <= 0) {
        add_error("logging.max_file_size_mb", "must be positive", std::to_string(logging.max_file_size_mb));
    }
    if (logging.max_backup_files < 0) {
        add_error("logging.max_backup_files", "must not be negative", std::to_string(logging.max_backup_files));
    }

    return errors_.size() == before ? Result<bool>::success(true) : make_result("logging");
}

ConfigValidator::ValidationResult ConfigValidator::validate_price_feed_config(const PriceFeedConfig& price_feed) {
    size_t before = errors_.size();

    if (price_feed.min_valid_sources < 1) {
        add_error("price_feed.min_valid_sources", "must be at least 1", std::to_string(price_feed.min_valid_sources));
    }
    if (price_feed.worker_count < 1) {
        add_error("price_feed.worker_count", "must be at least 1", std::to_string(price_feed.worker_count));
    }
    if (price_feed.min_update_interval_ms <= 0) {
        add_error("price_feed.min_update_interval_ms", "must be positive",
                  std::to_string(price_feed.min_update_interval_ms));
    }
    if (price_feed.min_update_interval_ms > price_feed.max_update_interval_ms) {
        add_error("price_feed.max_update_interval_ms", "must not be below min_update_interval_ms",
                  std::to_string(price_feed.max_update_interval_ms));
    }
    if (price_feed.default_timeout_ms <= 0) {
        add_error("price_feed.default_timeout_ms", "must be positive", std::to_string(price_feed.default_timeout_ms));
    }
    if (price_feed.max_price_feeds < 1) {
        add_error("price_feed.max_price_feeds", "must be at least 1", std::to_string(price_feed.max_price_feeds));
    }
    if (!(price_feed.deviation_threshold >= 0.0)) {
        add_error("price_feed.deviation_threshold", "must not be negative",
                  std::to_string(price_feed.deviation_threshold));
    }
    if (!(price_feed.default_weight > 0.0)) {
        add_error("price_feed.default_weight", "must be positive", std::to_string(price_feed.default_weight));
    }

    std::set<std::string> names;
    for (size_t i = 0; i < price_feed.sources.size(); ++i) {
        const auto& source = price_feed.sources[i];
        std::string field = "price_feed.sources[" + std::to_string(i) + "]";
        if (source.name.empty()) {
            add_error(field + ".name", "must not be empty");
        } else if (!names.insert(source.name).second) {
            add_error(field + ".name", "duplicate source name", source.name);
        }
        if (source.weight && !(*source.weight > 0.0)) {
            add_error(field + ".weight", "must be positive", std::to_string(*source.weight));
        }
        if (source.endpoint.empty()) {
            add_error(field + ".endpoint", "must not be empty");
        }
    }

    const auto& supported = price_feed.supported_symbols;
    for (const auto& symbol : price_feed.tracked_symbols) {
        if (std::find(supported.begin(), supported.end(), symbol) == supported.end()) {
            add_error("price_feed.tracked_symbols", "symbol is not in supported_symbols", symbol);
        }
    }
    if (static_cast<int>(price_feed.tracked_symbols.size()) > price_feed.max_price_feeds) {
        add_error("price_feed.tracked_symbols", "exceeds max_price_feeds",
                  std::to_string(price_feed.tracked_symbols.size()));
    }

    return errors_.size() == before ? Result<bool>::success(true) : make_result("price_feed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_automation_config(const AutomationConfig& automation) {
    size_t before = errors_.size();

    if (automation.monitor_interval_ms <= 0) {
        add_error("automation.monitor_interval_ms", "must be positive", std::to_string(automation.monitor_interval_ms));
    }
    if (automation.schedule_tick_ms <= 0) {
        add_error("automation.schedule_tick_ms", "must be positive", std::to_string(automation.schedule_tick_ms));
    }
    if (automation.schedule_timezone != "local" && automation.schedule_timezone != "utc") {
        add_error("automation.schedule_timezone", "must be 'local' or 'utc'", automation.schedule_timezone);
    }
    if (automation.dispatch_workers < 1) {
        add_error("automation.dispatch_workers", "must be at least 1", std::to_string(automation.dispatch_workers));
    }
    if (automation.dispatch_queue_size < 0) {
        add_error("automation.dispatch_queue_size", "must not be negative",
                  std::to_string(automation.dispatch_queue_size));
    }
    if (automation.max_triggers_per_owner < 0) {
        add_error("automation.max_triggers_per_owner", "must not be negative",
                  std::to_string(automation.max_triggers_per_owner));
    }

    return errors_.size() == before ? Result<bool>::success(true) : make_result("automation");
}

ConfigValidator::ValidationResult ConfigValidator::validate_function_executor_config(
    const FunctionExecutorConfig& executor) {
    size_t before = errors_.size();

    if (executor.endpoint.rfind("http://", 0) != 0 && executor.endpoint.rfind("https://", 0) != 0) {
        add_error("function_executor.endpoint", "must be an http(s) URL", executor.endpoint);
    }
    if (executor.timeout_ms <= 0) {
        add_error("function_executor.timeout_ms", "must be positive", std::to_string(executor.timeout_ms));
    }

    return errors_.size() == before ? Result<bool>::success(true) : make_result("function_executor");
}

ConfigValidator::ValidationResult ConfigValidator::make_result(const std::string& section) const {
    if (errors_.empty()) {
        return Result<bool>::success(true);
    }
    std::string message = section + " validation failed with " + std::to_string(errors_.size()) + " error(s)";
    for (const auto& error : errors_) {
        message += "; " + error.field + ": " + error.message;
    }
    return Result<bool>::error(ErrorCode::Configuration, message);
}

void ConfigValidator::add_error(const std::string& field, const std::string& message, const std::string& value) {
    errors_.push_back(ValidationError{field, message, value});
}

} // namespace neo
