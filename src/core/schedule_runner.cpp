#include "schedule_runner.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace neo {

namespace {

long long to_epoch_ms(SystemTime tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

ScheduleRunner::ScheduleRunner(std::shared_ptr<TriggerRegistry> registry, std::shared_ptr<Dispatcher> dispatcher,
                               std::chrono::milliseconds tick_interval)
    : registry_(std::move(registry)), dispatcher_(std::move(dispatcher)), tick_interval_(tick_interval) {}

ScheduleRunner::~ScheduleRunner() {
    stop();
}

void ScheduleRunner::start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        started_at_ = std::chrono::system_clock::now();
        entries_.clear();
    }
    thread_ = std::thread(&ScheduleRunner::run, this);
    NEO_LOG_INFO("ScheduleRunner started (tick {} ms)", tick_interval_.count());
}

void ScheduleRunner::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    NEO_LOG_INFO("ScheduleRunner stopped");
}

void ScheduleRunner::run() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (running_) {
        lock.unlock();
        tick(std::chrono::system_clock::now());
        lock.lock();
        wait_cv_.wait_for(lock, tick_interval_, [this] { return !running_; });
    }
}

size_t ScheduleRunner::tick(SystemTime now) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    std::unordered_set<std::string> seen;
    size_t fired = 0;

    registry_->for_each_schedule([&](const Trigger& trigger, const CronExpression& cron) {
        seen.insert(trigger.id);

        auto it = entries_.find(trigger.id);
        if (it == entries_.end() || it->second.created_at != trigger.created_at) {
            // Nothing before registration (or before this runner started) is owed
            SystemTime base = std::max(trigger.created_at, started_at_);
            it = entries_.insert_or_assign(trigger.id, Entry{trigger.created_at, cron.next(base)}).first;
        }

        auto& entry = it->second;
        if (!entry.next_fire || *entry.next_fire > now) {
            return;
        }

        nlohmann::json context{{"scheduled_at", to_epoch_ms(*entry.next_fire)}};
        if (dispatcher_->dispatch(trigger, context)) {
            ++fired;
        }
        // Missed instants collapse into this single firing
        entry.next_fire = cron.next(now);
        if (!entry.next_fire) {
            NEO_LOG_WARN("Schedule trigger {} has no further activation for '{}'", trigger.id, cron.expression());
        }
    });

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (seen.count(it->first) == 0) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (fired > 0) {
        NEO_LOG_DEBUG("ScheduleRunner dispatched {} trigger(s)", fired);
    }
    return fired;
}

} // namespace neo
