#include "trigger_registry.hpp"
#include "exceptions.hpp"
#include "price_alert.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <mutex>

namespace neo {

TriggerRegistry::TriggerRegistry(CronTimezone timezone, size_t max_triggers_per_owner)
    : timezone_(timezone), max_triggers_per_owner_(max_triggers_per_owner) {}

Trigger TriggerRegistry::build(const TriggerDefinition& definition) const {
    if (definition.id.empty()) {
        throw InvalidTriggerError("id must not be empty");
    }
    if (definition.owner_id.empty()) {
        throw InvalidTriggerError("owner_id must not be empty");
    }
    if (definition.function_id.empty()) {
        throw InvalidTriggerError("function_id must not be empty");
    }

    auto type = parse_trigger_type(definition.type);
    if (!type) {
        throw InvalidTriggerError("unknown trigger type '" + definition.type + "'");
    }

    nlohmann::json parameters = definition.parameters.is_null() ? nlohmann::json::object() : definition.parameters;
    auto now = std::chrono::system_clock::now();

    if (*type == TriggerType::Schedule) {
        try {
            CronExpression cron = CronExpression::parse(definition.schedule, timezone_);
            return Trigger{definition.id, definition.owner_id, definition.function_id, std::move(parameters),
                           ScheduleSpec{std::move(cron)}, now};
        } catch (const CronParseError& e) {
            throw InvalidScheduleError(e.what());
        }
    }

    PriceAlertCondition condition = parse_price_condition(definition.condition);
    return Trigger{definition.id, definition.owner_id, definition.function_id, std::move(parameters),
                   PriceAlertSpec{std::move(condition)}, now};
}

Trigger TriggerRegistry::create(const TriggerDefinition& definition) {
    // Parsing touches no shared state, so failures leave the registry untouched
    Trigger trigger = build(definition);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (triggers_.count(trigger.id) > 0) {
            throw DuplicateIdError(trigger.id);
        }

        size_t owned = 0;
        auto owner_it = owner_counts_.find(trigger.owner_id);
        if (owner_it != owner_counts_.end()) {
            owned = owner_it->second;
        }
        if (max_triggers_per_owner_ > 0 && owned >= max_triggers_per_owner_) {
            throw TriggerLimitError("Owner " + trigger.owner_id + " already has " + std::to_string(owned) +
                                    " triggers (limit " + std::to_string(max_triggers_per_owner_) + ")");
        }

        if (const auto* condition = trigger.alert_condition()) {
            alert_index_[condition->symbol][trigger.owner_id].push_back(trigger.id);
        }
        ++owner_counts_[trigger.owner_id];
        triggers_.emplace(trigger.id, trigger);
    }

    NEO_LOG_INFO("Trigger created: id={} owner={} type={} function={}", trigger.id, trigger.owner_id,
                 to_string(trigger.type()), trigger.function_id);
    return trigger;
}

void TriggerRegistry::remove(const std::string& id) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = triggers_.find(id);
        if (it == triggers_.end()) {
            throw NotFoundError("Trigger with ID " + id + " not found");
        }

        unindex_alert(it->second);

        auto owner_it = owner_counts_.find(it->second.owner_id);
        if (owner_it != owner_counts_.end() && --owner_it->second == 0) {
            owner_counts_.erase(owner_it);
        }

        triggers_.erase(it);
    }

    NEO_LOG_INFO("Trigger deleted: id={}", id);
}

// Caller holds the exclusive lock
void TriggerRegistry::unindex_alert(const Trigger& trigger) {
    const auto* condition = trigger.alert_condition();
    if (!condition) {
        return;
    }

    auto symbol_it = alert_index_.find(condition->symbol);
    if (symbol_it == alert_index_.end()) {
        return;
    }

    auto& owners = symbol_it->second;
    auto owner_it = owners.find(trigger.owner_id);
    if (owner_it != owners.end()) {
        auto& ids = owner_it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), trigger.id), ids.end());
        if (ids.empty()) {
            owners.erase(owner_it);
        }
    }

    if (owners.empty()) {
        alert_index_.erase(symbol_it);
    }
}

Trigger TriggerRegistry::get(const std::string& id) const {
    auto trigger = find(id);
    if (!trigger) {
        throw NotFoundError("Trigger with ID " + id + " not found");
    }
    return *trigger;
}

std::optional<Trigger> TriggerRegistry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = triggers_.find(id);
    if (it == triggers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Trigger> TriggerRegistry::list() const {
    std::vector<Trigger> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(triggers_.size());
        for (const auto& entry : triggers_) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(), [](const Trigger& a, const Trigger& b) { return a.id < b.id; });
    return result;
}

std::vector<Trigger> TriggerRegistry::list_by_owner(const std::string& owner_id) const {
    std::vector<Trigger> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : triggers_) {
            if (entry.second.owner_id == owner_id) {
                result.push_back(entry.second);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const Trigger& a, const Trigger& b) { return a.id < b.id; });
    return result;
}

size_t TriggerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return triggers_.size();
}

std::vector<std::string> TriggerRegistry::alert_symbols() const {
    std::vector<std::string> symbols;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        symbols.reserve(alert_index_.size());
        for (const auto& entry : alert_index_) {
            symbols.push_back(entry.first);
        }
    }
    std::sort(symbols.begin(), symbols.end());
    return symbols;
}

size_t TriggerRegistry::alert_count(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = alert_index_.find(symbol);
    if (it == alert_index_.end()) {
        return 0;
    }
    size_t count = 0;
    for (const auto& owner : it->second) {
        count += owner.second.size();
    }
    return count;
}

bool TriggerRegistry::has_alert_bucket(const std::string& symbol, const std::string& owner_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = alert_index_.find(symbol);
    return it != alert_index_.end() && it->second.count(owner_id) > 0;
}

void TriggerRegistry::for_each_alert(const std::string& symbol, const AlertVisitor& visitor) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto symbol_it = alert_index_.find(symbol);
    if (symbol_it == alert_index_.end()) {
        return;
    }

    for (const auto& owner : symbol_it->second) {
        for (const auto& id : owner.second) {
            auto it = triggers_.find(id);
            if (it == triggers_.end()) {
                continue;
            }
            if (const auto* condition = it->second.alert_condition()) {
                visitor(it->second, *condition);
            }
        }
    }
}

void TriggerRegistry::for_each_schedule(const ScheduleVisitor& visitor) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : triggers_) {
        if (const auto* cron = entry.second.schedule()) {
            visitor(entry.second, *cron);
        }
    }
}

} // namespace neo
