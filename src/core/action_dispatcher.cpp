#include "action_dispatcher.hpp"
#include "../utils/logger.hpp"
#include <chrono>

namespace neo {

ActionDispatcher::ActionDispatcher(std::shared_ptr<FunctionExecutor> executor, size_t workers,
                                   size_t max_queue_size, std::shared_ptr<MetricsRegistry> metrics)
    : executor_(std::move(executor)), metrics_(std::move(metrics)), pool_(workers, max_queue_size) {
    NEO_LOG_INFO("ActionDispatcher started with {} workers, queue limit {}", pool_.thread_count(), max_queue_size);
}

ActionDispatcher::~ActionDispatcher() {
    shutdown();
}

bool ActionDispatcher::dispatch(const Trigger& trigger, const nlohmann::json& context) {
    nlohmann::json parameters = build_parameters(trigger, context);

    bool queued = pool_.try_submit([this, trigger, parameters = std::move(parameters)]() {
        execute(trigger, parameters);
    });

    if (!queued) {
        record("rejected");
        NEO_LOG_ERROR("Dispatch rejected for trigger {}: dispatcher queue is full or stopped", trigger.id);
        return false;
    }

    record("queued");
    NEO_LOG_DEBUG("Dispatch queued for trigger {} (function {})", trigger.id, trigger.function_id);
    return true;
}

void ActionDispatcher::execute(const Trigger& trigger, const nlohmann::json& parameters) {
    if (!executor_) {
        record("failed");
        NEO_LOG_ERROR("Failed to execute function {} for trigger {}: no function executor configured",
                      trigger.function_id, trigger.id);
        return;
    }

    auto start = std::chrono::steady_clock::now();
    try {
        ExecutionResult result = executor_->execute(trigger.function_id, parameters);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        record("succeeded");
        NEO_LOG_INFO("Executed function {} for trigger {} (execution {}, status {}, {} ms)", trigger.function_id,
                     trigger.id, result.execution_id, result.status, elapsed.count());
    } catch (const std::exception& e) {
        record("failed");
        NEO_LOG_ERROR("Failed to execute function {} for trigger {}: {}", trigger.function_id, trigger.id, e.what());
    }
}

void ActionDispatcher::wait_for_idle() {
    pool_.wait_for_all();
}

void ActionDispatcher::shutdown() {
    if (pool_.is_running()) {
        pool_.shutdown();
        NEO_LOG_INFO("ActionDispatcher stopped");
    }
}

nlohmann::json ActionDispatcher::build_parameters(const Trigger& trigger, const nlohmann::json& context) {
    nlohmann::json parameters = trigger.parameters;
    if (!parameters.is_object() || parameters.contains("trigger")) {
        return parameters;
    }

    nlohmann::json metadata{
        {"id", trigger.id},
        {"type", to_string(trigger.type())},
        {"fired_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch()).count()}
    };

    if (const auto* cron = trigger.schedule()) {
        metadata["schedule"] = cron->expression();
    } else if (const auto* condition = trigger.alert_condition()) {
        metadata["symbol"] = condition->symbol;
        metadata["comparison"] = to_string(condition->comparison);
        metadata["threshold"] = condition->threshold;
    }

    if (context.is_object()) {
        for (const auto& item : context.items()) {
            metadata[item.key()] = item.value();
        }
    }

    parameters["trigger"] = std::move(metadata);
    return parameters;
}

void ActionDispatcher::record(const char* status) {
    if (metrics_) {
        metrics_->increment_counter("dispatch_total", {{"status", status}});
    }
}

} // namespace neo
