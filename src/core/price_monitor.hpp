#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include "dispatcher.hpp"
#include "price_cache_reader.hpp"
#include "trigger_registry.hpp"

namespace neo {

// Polls the price cache on a fixed interval and dispatches every price alert whose
// condition holds. Level-triggered: an alert that stays true fires again on every tick.
class PriceMonitor {
public:
    PriceMonitor(std::shared_ptr<const PriceCacheReader> prices, std::shared_ptr<TriggerRegistry> registry,
                 std::shared_ptr<Dispatcher> dispatcher,
                 std::chrono::milliseconds interval = std::chrono::minutes(1));
    ~PriceMonitor();

    void start();
    void stop();
    bool is_running() const { return running_; }

    // One evaluation pass. Returns the number of alerts dispatched.
    size_t check_alerts();

private:
    void run();

    std::shared_ptr<const PriceCacheReader> prices_;
    std::shared_ptr<TriggerRegistry> registry_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace neo
