#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include "dispatcher.hpp"
#include "function_executor.hpp"
#include "../utils/metrics.hpp"
#include "../utils/thread_pool.hpp"

namespace neo {

// Fire-and-forget bridge to the FunctionExecutor. Actions run on a bounded worker pool;
// their outcome is only visible in logs and metrics and is never retried here.
class ActionDispatcher : public Dispatcher {
public:
    ActionDispatcher(std::shared_ptr<FunctionExecutor> executor, size_t workers, size_t max_queue_size,
                     std::shared_ptr<MetricsRegistry> metrics = nullptr);
    ~ActionDispatcher() override;

    bool dispatch(const Trigger& trigger, const nlohmann::json& context) override;

    // Blocks until every queued action has run
    void wait_for_idle();

    // Runs what is already queued, then stops the workers. Later dispatches are rejected.
    void shutdown();

    // Parameters sent to the executor: the trigger's own parameters plus a "trigger" object
    // describing the firing, unless the owner already supplied a "trigger" key
    static nlohmann::json build_parameters(const Trigger& trigger, const nlohmann::json& context);

private:
    void execute(const Trigger& trigger, const nlohmann::json& parameters);
    void record(const char* status);

    std::shared_ptr<FunctionExecutor> executor_;
    std::shared_ptr<MetricsRegistry> metrics_;
    ThreadPool pool_;
};

} // namespace neo
