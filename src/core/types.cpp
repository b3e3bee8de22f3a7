#include "types.hpp"
#include "price_alert.hpp"
#include <type_traits>

namespace neo {

namespace {

long long to_epoch_ms(SystemTime tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* to_string(TriggerType type) {
    switch (type) {
        case TriggerType::Schedule: return "schedule";
        case TriggerType::PriceAlert: return "price_alert";
    }
    return "unknown";
}

const char* to_string(Comparison comparison) {
    switch (comparison) {
        case Comparison::Above: return "above";
        case Comparison::Below: return "below";
    }
    return "unknown";
}

std::optional<TriggerType> parse_trigger_type(const std::string& name) {
    if (name == "schedule") {
        return TriggerType::Schedule;
    }
    if (name == "price_alert") {
        return TriggerType::PriceAlert;
    }
    return std::nullopt;
}

nlohmann::json to_json(const AggregatedPrice& price) {
    return nlohmann::json{
        {"symbol", price.symbol},
        {"value", price.value},
        {"computed_at", to_epoch_ms(price.computed_at)},
        {"contributing_source_count", price.contributing_source_count}
    };
}

nlohmann::json to_json(const Trigger& trigger) {
    nlohmann::json j{
        {"id", trigger.id},
        {"owner_id", trigger.owner_id},
        {"type", to_string(trigger.type())},
        {"function_id", trigger.function_id},
        {"parameters", trigger.parameters},
        {"created_at", to_epoch_ms(trigger.created_at)}
    };

    std::visit([&j](const auto& spec) {
        using T = std::decay_t<decltype(spec)>;
        if constexpr (std::is_same_v<T, ScheduleSpec>) {
            j["schedule"] = spec.cron.expression();
        } else {
            j["condition"] = format_price_condition(spec.condition);
        }
    }, trigger.spec);

    return j;
}

} // namespace neo
