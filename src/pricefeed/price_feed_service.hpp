#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "price_aggregator.hpp"

namespace neo {

struct FeedStatus {
    std::string symbol;
    std::chrono::milliseconds interval{0};
    std::optional<SystemTime> last_success;
    double last_value = 0.0;
    int consecutive_failures = 0;
    std::string last_error;
};

// Keeps one recurring aggregation cycle per tracked symbol. Cycles for the same symbol
// never overlap; a slow cycle delays that symbol only.
class PriceFeedService {
public:
    explicit PriceFeedService(std::shared_ptr<PriceAggregator> aggregator);
    ~PriceFeedService();

    void start();

    // Stops scheduling and waits for cycles already running to finish
    void stop();
    bool is_running() const { return running_; }

    // Interval defaults to update_interval_ms and is clamped into [min, max]. Re-adding a
    // tracked symbol only changes its interval. Throws UnsupportedSymbolError, MaxFeedsExceededError.
    void add_feed(const std::string& symbol, std::optional<std::chrono::milliseconds> interval = std::nullopt);

    // Also drops the cached price. Throws NotFoundError.
    void remove_feed(const std::string& symbol);

    // Runs one cycle now, on the calling thread. Throws NotFoundError for an untracked symbol.
    Result<AggregatedPrice> trigger_update(const std::string& symbol);

    std::vector<FeedStatus> feeds() const;
    size_t feed_count() const;

    std::chrono::milliseconds clamp_interval(std::chrono::milliseconds interval) const;

private:
    struct Feed {
        FeedStatus status;
        std::chrono::steady_clock::time_point next_due;
        bool in_flight = false;
    };

    void scheduler_loop();
    void run_cycle(const std::string& symbol);
    Result<AggregatedPrice> aggregate_symbol(const std::string& symbol);
    void record_outcome(const std::string& symbol, const Result<AggregatedPrice>& result);

    std::shared_ptr<PriceAggregator> aggregator_;
    ThreadPool cycle_pool_;

    mutable std::mutex feeds_mutex_;
    std::condition_variable feeds_cv_; // scheduler wakeups and in-flight hand-off
    std::map<std::string, Feed> feeds_;

    std::thread scheduler_thread_;
    std::atomic<bool> running_{false};
};

} // namespace neo
