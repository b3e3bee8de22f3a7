#include "price_monitor.hpp"
#include "price_alert.hpp"
#include "../utils/logger.hpp"

namespace neo {

PriceMonitor::PriceMonitor(std::shared_ptr<const PriceCacheReader> prices, std::shared_ptr<TriggerRegistry> registry,
                           std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds interval)
    : prices_(std::move(prices)), registry_(std::move(registry)), dispatcher_(std::move(dispatcher)),
      interval_(interval) {}

PriceMonitor::~PriceMonitor() {
    stop();
}

void PriceMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&PriceMonitor::run, this);
    NEO_LOG_INFO("PriceMonitor started (interval {} ms)", interval_.count());
}

void PriceMonitor::stop() {
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
    NEO_LOG_INFO("PriceMonitor stopped");
}

void PriceMonitor::run() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (running_) {
        if (wait_cv_.wait_for(lock, interval_, [this] { return !running_; })) {
            break;
        }
        lock.unlock();
        check_alerts();
        lock.lock();
    }
}

size_t PriceMonitor::check_alerts() {
    auto snapshot = prices_->get_all_prices();
    size_t fired = 0;

    for (const auto& entry : snapshot) {
        const AggregatedPrice& price = entry.second;
        registry_->for_each_alert(entry.first, [&](const Trigger& trigger, const PriceAlertCondition& condition) {
            if (!evaluate(condition, price.value)) {
                return;
            }

            nlohmann::json context{
                {"price", price.value},
                {"price_computed_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                                          price.computed_at.time_since_epoch()).count()}
            };

            if (dispatcher_->dispatch(trigger, context)) {
                ++fired;
                NEO_LOG_DEBUG("Price alert {} matched: {} at {}", trigger.id, format_price_condition(condition),
                              price.value);
            }
        });
    }

    return fired;
}

} // namespace neo
