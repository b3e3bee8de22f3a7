#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include "dispatcher.hpp"
#include "trigger_registry.hpp"

namespace neo {

// Fires schedule triggers when their cron expression comes due. A trigger is first
// evaluated on the tick after it is registered and never fires for instants that passed
// before it was seen.
class ScheduleRunner {
public:
    enum class State {
        Stopped,
        Running
    };

    ScheduleRunner(std::shared_ptr<TriggerRegistry> registry, std::shared_ptr<Dispatcher> dispatcher,
                   std::chrono::milliseconds tick_interval = std::chrono::seconds(1));
    ~ScheduleRunner();

    void start();

    // Returns once the evaluation thread has exited; every match it found has been handed
    // to the dispatcher by then.
    void stop();

    State state() const { return running_ ? State::Running : State::Stopped; }
    bool is_running() const { return running_; }

    // One evaluation pass at `now`. Returns the number of triggers dispatched.
    size_t tick(SystemTime now);

private:
    struct Entry {
        SystemTime created_at;
        std::optional<SystemTime> next_fire;
    };

    void run();

    std::shared_ptr<TriggerRegistry> registry_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::chrono::milliseconds tick_interval_;

    std::mutex entries_mutex_;
    std::unordered_map<std::string, Entry> entries_;
    SystemTime started_at_{};

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace neo
