#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "../utils/cron_expression.hpp"

namespace neo {

using SystemTime = std::chrono::system_clock::time_point;

struct AggregatedPrice {
    std::string symbol;
    double value = 0.0;
    SystemTime computed_at;
    int contributing_source_count = 0;
};

enum class Comparison {
    Above,
    Below
};

struct PriceAlertCondition {
    std::string symbol;
    Comparison comparison = Comparison::Above;
    double threshold = 0.0;
};

enum class TriggerType {
    Schedule,
    PriceAlert
};

struct ScheduleSpec {
    CronExpression cron;
};

struct PriceAlertSpec {
    PriceAlertCondition condition;
};

using TriggerSpec = std::variant<ScheduleSpec, PriceAlertSpec>;

// Immutable once registered; replace by delete + create
struct Trigger {
    std::string id;
    std::string owner_id;
    std::string function_id;
    nlohmann::json parameters;
    TriggerSpec spec;
    SystemTime created_at;

    TriggerType type() const {
        return std::holds_alternative<ScheduleSpec>(spec) ? TriggerType::Schedule : TriggerType::PriceAlert;
    }

    // Null when the trigger is of the other kind
    const CronExpression* schedule() const {
        auto* s = std::get_if<ScheduleSpec>(&spec);
        return s ? &s->cron : nullptr;
    }

    const PriceAlertCondition* alert_condition() const {
        auto* a = std::get_if<PriceAlertSpec>(&spec);
        return a ? &a->condition : nullptr;
    }
};

// Unvalidated creation request, as it arrives from the API layer or the config file
struct TriggerDefinition {
    std::string id;
    std::string owner_id;
    std::string type;       // "schedule" | "price_alert"
    std::string schedule;   // cron expression, schedule triggers only
    std::string condition;  // "SYMBOL above|below THRESHOLD", price alerts only
    std::string function_id;
    nlohmann::json parameters = nlohmann::json::object();
};

const char* to_string(TriggerType type);
const char* to_string(Comparison comparison);
std::optional<TriggerType> parse_trigger_type(const std::string& name);

nlohmann::json to_json(const AggregatedPrice& price);
nlohmann::json to_json(const Trigger& trigger);

} // namespace neo
