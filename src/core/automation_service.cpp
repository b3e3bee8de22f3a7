#include "automation_service.hpp"
#include "exceptions.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cctype>

namespace neo {

TriggerDefinition to_trigger_definition(const TriggerConfig& config) {
    TriggerDefinition definition;
    definition.id = config.id;
    definition.owner_id = config.owner_id;
    definition.type = config.type;
    definition.schedule = config.schedule;
    definition.condition = config.condition;
    definition.function_id = config.function_id;
    definition.parameters = config.parameters;
    return definition;
}

CronTimezone parse_cron_timezone(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "utc" ? CronTimezone::Utc : CronTimezone::Local;
}

AutomationService::AutomationService(const AutomationConfig& config, std::shared_ptr<const PriceCacheReader> prices,
                                     std::shared_ptr<Dispatcher> dispatcher)
    : registry_(std::make_shared<TriggerRegistry>(parse_cron_timezone(config.schedule_timezone),
                                                  static_cast<size_t>(std::max(0, config.max_triggers_per_owner)))),
      dispatcher_(std::move(dispatcher)) {
    schedule_runner_ = std::make_unique<ScheduleRunner>(registry_, dispatcher_,
                                                        std::chrono::milliseconds(config.schedule_tick_ms));
    price_monitor_ = std::make_unique<PriceMonitor>(std::move(prices), registry_, dispatcher_,
                                                    std::chrono::milliseconds(config.monitor_interval_ms));
}

AutomationService::~AutomationService() {
    stop();
}

void AutomationService::start() {
    if (running_) {
        return;
    }
    schedule_runner_->start();
    price_monitor_->start();
    running_ = true;
    NEO_LOG_INFO("AutomationService started with {} triggers", registry_->size());
}

void AutomationService::stop() {
    if (!running_) {
        return;
    }
    schedule_runner_->stop();
    price_monitor_->stop();
    running_ = false;
    NEO_LOG_INFO("AutomationService stopped");
}

Trigger AutomationService::create_trigger(const TriggerDefinition& definition) {
    return registry_->create(definition);
}

void AutomationService::delete_trigger(const std::string& id) {
    registry_->remove(id);
}

Trigger AutomationService::get_trigger(const std::string& id) const {
    return registry_->get(id);
}

std::vector<Trigger> AutomationService::list_triggers() const {
    return registry_->list();
}

std::vector<Trigger> AutomationService::list_triggers(const std::string& owner_id) const {
    return registry_->list_by_owner(owner_id);
}

bool AutomationService::execute_trigger(const std::string& id) {
    Trigger trigger = registry_->get(id);
    NEO_LOG_INFO("Manual execution requested for trigger {}", id);
    return dispatcher_->dispatch(trigger, nlohmann::json{{"manual", true}});
}

size_t AutomationService::load_triggers(const std::vector<TriggerConfig>& triggers) {
    size_t loaded = 0;
    for (const auto& config : triggers) {
        try {
            registry_->create(to_trigger_definition(config));
            ++loaded;
        } catch (const NeoException& e) {
            NEO_LOG_ERROR("Skipping configured trigger '{}': {} ({})", config.id, e.what(), to_string(e.code()));
        }
    }
    NEO_LOG_INFO("Loaded {} of {} configured triggers", loaded, triggers.size());
    return loaded;
}

} // namespace neo
