#pragma once

#include <string>
#include <vector>
#include "config_types.hpp"
#include "../core/result.hpp"

namespace neo {

class ConfigManager;

struct ValidationError {
    std::string field;
    std::string message;
    std::string value;
};

// Collects every violation instead of stopping at the first one
class ConfigValidator {
public:
    using ValidationResult = Result<bool>;
    using ValidationErrors = std::vector<ValidationError>;

    ValidationResult validate(ConfigManager& config);

    // Validate specific sections
    ValidationResult validate_logging_config(const LoggingConfig& logging);
    ValidationResult validate_price_feed_config(const PriceFeedConfig& price_feed);
    ValidationResult validate_automation_config(const AutomationConfig& automation);
    ValidationResult validate_function_executor_config(const FunctionExecutorConfig& executor);

    const ValidationErrors& get_errors() const { return errors_; }
    void clear_errors() { errors_.clear(); }

private:
    ValidationResult make_result(const std::string& section) const;
    void add_error(const std::string& field, const std::string& message, const std::string& value = "");

    ValidationErrors errors_;
};

} // namespace neo
