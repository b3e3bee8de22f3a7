#pragma once

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

namespace neo {

// Owns every registered trigger plus the price-alert index (symbol -> owner -> trigger ids).
// Mutations take the exclusive lock and update both structures together; readers take the
// shared lock, so no reader can observe one without the other.
class TriggerRegistry {
public:
    using AlertVisitor = std::function<void(const Trigger&, const PriceAlertCondition&)>;
    using ScheduleVisitor = std::function<void(const Trigger&, const CronExpression&)>;

    // max_triggers_per_owner == 0 disables the cap
    explicit TriggerRegistry(CronTimezone timezone = CronTimezone::Local, size_t max_triggers_per_owner = 0);

    // All-or-nothing. Throws InvalidTriggerError, InvalidScheduleError, InvalidConditionError,
    // DuplicateIdError or TriggerLimitError.
    Trigger create(const TriggerDefinition& definition);

    // Throws NotFoundError
    void remove(const std::string& id);

    // Throws NotFoundError
    Trigger get(const std::string& id) const;
    std::optional<Trigger> find(const std::string& id) const;

    // Ordered by id
    std::vector<Trigger> list() const;
    std::vector<Trigger> list_by_owner(const std::string& owner_id) const;

    size_t size() const;

    // Symbols with at least one registered alert
    std::vector<std::string> alert_symbols() const;
    size_t alert_count(const std::string& symbol) const;
    bool has_alert_bucket(const std::string& symbol, const std::string& owner_id) const;

    // Both visitors run under the shared lock: they must not block or call back into the registry
    void for_each_alert(const std::string& symbol, const AlertVisitor& visitor) const;
    void for_each_schedule(const ScheduleVisitor& visitor) const;

private:
    Trigger build(const TriggerDefinition& definition) const;
    void unindex_alert(const Trigger& trigger);

    CronTimezone timezone_;
    size_t max_triggers_per_owner_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Trigger> triggers_;
    std::unordered_map<std::string, std::map<std::string, std::vector<std::string>>> alert_index_;
    std::unordered_map<std::string, size_t> owner_counts_;
};

} // namespace neo
