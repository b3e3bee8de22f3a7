#pragma once

#include <memory>
#include <string>
#include <vector>
#include "dispatcher.hpp"
#include "price_cache_reader.hpp"
#include "price_monitor.hpp"
#include "schedule_runner.hpp"
#include "trigger_registry.hpp"
#include "../utils/config_types.hpp"

namespace neo {

TriggerDefinition to_trigger_definition(const TriggerConfig& config);
CronTimezone parse_cron_timezone(const std::string& name);

// Trigger management API plus the two engines that fire triggers: the schedule runner for
// cron triggers and the price monitor for price alerts.
class AutomationService {
public:
    AutomationService(const AutomationConfig& config, std::shared_ptr<const PriceCacheReader> prices,
                      std::shared_ptr<Dispatcher> dispatcher);
    ~AutomationService();

    void start();
    void stop();
    bool is_running() const { return running_; }

    // See TriggerRegistry for the error contract
    Trigger create_trigger(const TriggerDefinition& definition);
    void delete_trigger(const std::string& id);
    Trigger get_trigger(const std::string& id) const;
    std::vector<Trigger> list_triggers() const;
    std::vector<Trigger> list_triggers(const std::string& owner_id) const;

    // Fires the trigger now, whatever its condition. Throws NotFoundError; returns false
    // when the dispatcher refused the action.
    bool execute_trigger(const std::string& id);

    // Registers configured triggers. Invalid entries are logged and skipped.
    size_t load_triggers(const std::vector<TriggerConfig>& triggers);

    std::shared_ptr<TriggerRegistry> registry() const { return registry_; }
    ScheduleRunner& schedule_runner() { return *schedule_runner_; }
    PriceMonitor& price_monitor() { return *price_monitor_; }

private:
    std::shared_ptr<TriggerRegistry> registry_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<ScheduleRunner> schedule_runner_;
    std::unique_ptr<PriceMonitor> price_monitor_;
    bool running_ = false;
};

} // namespace neo
