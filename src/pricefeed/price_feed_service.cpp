#include "price_feed_service.hpp"
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"
#include <algorithm>

namespace neo {

namespace {

size_t cycle_workers(const PriceFeedConfig& config) {
    return static_cast<size_t>(std::clamp(config.max_price_feeds, 1, 16));
}

} // namespace

PriceFeedService::PriceFeedService(std::shared_ptr<PriceAggregator> aggregator)
    : aggregator_(std::move(aggregator)), cycle_pool_(cycle_workers(aggregator_->config())) {}

PriceFeedService::~PriceFeedService() {
    stop();
    cycle_pool_.shutdown();
}

void PriceFeedService::start() {
    if (running_.exchange(true)) {
        return;
    }
    scheduler_thread_ = std::thread(&PriceFeedService::scheduler_loop, this);
    NEO_LOG_INFO("PriceFeedService started with {} feeds", feed_count());
}

void PriceFeedService::stop() {
    {
        std::lock_guard<std::mutex> lock(feeds_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    feeds_cv_.notify_all();
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    cycle_pool_.wait_for_all();
    NEO_LOG_INFO("PriceFeedService stopped");
}

std::chrono::milliseconds PriceFeedService::clamp_interval(std::chrono::milliseconds interval) const {
    const auto& config = aggregator_->config();
    return std::clamp(interval, std::chrono::milliseconds(config.min_update_interval_ms),
                      std::chrono::milliseconds(config.max_update_interval_ms));
}

void PriceFeedService::add_feed(const std::string& symbol, std::optional<std::chrono::milliseconds> interval) {
    if (!aggregator_->is_supported(symbol)) {
        throw UnsupportedSymbolError(symbol);
    }

    const auto& config = aggregator_->config();
    auto effective = clamp_interval(interval.value_or(std::chrono::milliseconds(config.update_interval_ms)));

    {
        std::lock_guard<std::mutex> lock(feeds_mutex_);
        auto it = feeds_.find(symbol);
        if (it != feeds_.end()) {
            it->second.status.interval = effective;
            NEO_LOG_INFO("Price feed {} interval updated to {} ms", symbol, effective.count());
            return;
        }

        if (static_cast<int>(feeds_.size()) >= config.max_price_feeds) {
            throw MaxFeedsExceededError(config.max_price_feeds);
        }

        Feed feed;
        feed.status.symbol = symbol;
        feed.status.interval = effective;
        feed.next_due = std::chrono::steady_clock::now();
        feeds_.emplace(symbol, std::move(feed));
    }

    feeds_cv_.notify_all();
    NEO_LOG_INFO("Price feed added: {} every {} ms", symbol, effective.count());
}

void PriceFeedService::remove_feed(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(feeds_mutex_);
        if (feeds_.erase(symbol) == 0) {
            throw NotFoundError("Price feed " + symbol + " not found");
        }
    }
    aggregator_->cache()->remove(symbol);
    feeds_cv_.notify_all();
    NEO_LOG_INFO("Price feed removed: {}", symbol);
}

Result<AggregatedPrice> PriceFeedService::trigger_update(const std::string& symbol) {
    {
        std::unique_lock<std::mutex> lock(feeds_mutex_);
        auto it = feeds_.find(symbol);
        if (it == feeds_.end()) {
            throw NotFoundError("Price feed " + symbol + " not found");
        }

        // Wait out a scheduled cycle already running for this symbol
        feeds_cv_.wait(lock, [this, &symbol] {
            auto current = feeds_.find(symbol);
            return current == feeds_.end() || !current->second.in_flight;
        });

        it = feeds_.find(symbol);
        if (it == feeds_.end()) {
            throw NotFoundError("Price feed " + symbol + " not found");
        }
        it->second.in_flight = true;
    }

    NEO_LOG_DEBUG("Manual price update requested for {}", symbol);
    auto result = aggregate_symbol(symbol);
    record_outcome(symbol, result);
    return result;
}

std::vector<FeedStatus> PriceFeedService::feeds() const {
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    std::vector<FeedStatus> statuses;
    statuses.reserve(feeds_.size());
    for (const auto& entry : feeds_) {
        statuses.push_back(entry.second.status);
    }
    return statuses;
}

size_t PriceFeedService::feed_count() const {
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    return feeds_.size();
}

void PriceFeedService::scheduler_loop() {
    std::unique_lock<std::mutex> lock(feeds_mutex_);

    while (running_) {
        auto now = std::chrono::steady_clock::now();
        auto wake_at = now + std::chrono::seconds(1);

        for (auto& entry : feeds_) {
            Feed& feed = entry.second;
            if (feed.in_flight) {
                continue;
            }
            if (feed.next_due <= now) {
                std::string symbol = entry.first;
                feed.in_flight = true;
                feed.next_due = now + feed.status.interval;
                if (!cycle_pool_.try_submit([this, symbol]() { run_cycle(symbol); })) {
                    feed.in_flight = false;
                    NEO_LOG_ERROR("Could not schedule aggregation cycle for {}", symbol);
                }
            }
            wake_at = std::min(wake_at, feed.next_due);
        }

        feeds_cv_.wait_until(lock, wake_at);
    }
}

void PriceFeedService::run_cycle(const std::string& symbol) {
    auto result = aggregate_symbol(symbol);
    record_outcome(symbol, result);
}

// Never throws: record_outcome must always run to clear the feed's in-flight flag
Result<AggregatedPrice> PriceFeedService::aggregate_symbol(const std::string& symbol) {
    try {
        return aggregator_->aggregate(symbol);
    } catch (const std::exception& e) {
        NEO_LOG_ERROR("Aggregation cycle for {} threw: {}", symbol, e.what());
        return Result<AggregatedPrice>::error(ErrorCode::SourceFailure,
                                              "Aggregation cycle for " + symbol + " failed: " + e.what());
    }
}

void PriceFeedService::record_outcome(const std::string& symbol, const Result<AggregatedPrice>& result) {
    {
        std::lock_guard<std::mutex> lock(feeds_mutex_);
        auto it = feeds_.find(symbol);
        if (it == feeds_.end()) {
            // Removed while the cycle ran; do not resurrect its price
            aggregator_->cache()->remove(symbol);
        } else {
            FeedStatus& status = it->second.status;
            it->second.in_flight = false;
            if (result.is_success()) {
                status.last_success = result.value().computed_at;
                status.last_value = result.value().value;
                status.consecutive_failures = 0;
                status.last_error.clear();
            } else {
                ++status.consecutive_failures;
                status.last_error = result.error().message;
            }
        }
    }
    feeds_cv_.notify_all();
}

} // namespace neo
