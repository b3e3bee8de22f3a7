#include "price_aggregator.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <memory>

namespace neo {

PriceAggregator::PriceAggregator(PriceFeedConfig config, std::vector<WeightedSource> sources,
                                 std::shared_ptr<PriceCache> cache, std::shared_ptr<MetricsRegistry> metrics)
    : config_(std::move(config)),
      sources_(std::move(sources)),
      supported_(config_.supported_symbols.begin(), config_.supported_symbols.end()),
      cache_(std::move(cache)),
      metrics_(std::move(metrics)),
      fetch_pool_(static_cast<size_t>(std::max(1, config_.worker_count))) {
    NEO_LOG_INFO("PriceAggregator initialized with {} sources, quorum {}, {} fetch workers", sources_.size(),
                 config_.min_valid_sources, fetch_pool_.thread_count());
}

bool PriceAggregator::is_supported(const std::string& symbol) const {
    return supported_.count(symbol) > 0;
}

Result<AggregatedPrice> PriceAggregator::aggregate(const std::string& symbol) {
    if (!is_supported(symbol)) {
        return Result<AggregatedPrice>::error(ErrorCode::UnsupportedSymbol, "Unsupported symbol: " + symbol);
    }

    std::vector<PriceSample> samples = collect_samples(symbol);
    OutlierSplit split = reject_outliers(samples, config_.deviation_threshold);

    for (const auto& outlier : split.rejected) {
        NEO_LOG_WARN("Rejected outlier for {} from {}: {} (median {})", symbol, outlier.source, outlier.value,
                     split.median);
    }

    if (metrics_) {
        metrics_->set_gauge("aggregation_source_success", static_cast<double>(samples.size()), {{"symbol", symbol}});
        metrics_->increment_counter("aggregation_outliers_rejected_total", {{"symbol", symbol}},
                                    static_cast<double>(split.rejected.size()));
    }

    int surviving = static_cast<int>(split.accepted.size());
    if (surviving == 0 || surviving < config_.min_valid_sources) {
        if (metrics_) {
            metrics_->increment_counter("aggregation_cycles_total", {{"symbol", symbol}, {"status", "insufficient_quorum"}});
        }
        NEO_LOG_WARN("Aggregation for {} failed: {} valid sources, {} required", symbol, surviving,
                     config_.min_valid_sources);
        return Result<AggregatedPrice>::error(
            ErrorCode::InsufficientQuorum,
            "Insufficient valid sources for " + symbol + ": " + std::to_string(surviving) + " of " +
                std::to_string(config_.min_valid_sources) + " required");
    }

    AggregatedPrice price;
    price.symbol = symbol;
    price.value = weighted_average(split.accepted);
    price.computed_at = std::chrono::system_clock::now();
    price.contributing_source_count = surviving;

    cache_->update(price);

    if (metrics_) {
        metrics_->increment_counter("aggregation_cycles_total", {{"symbol", symbol}, {"status", "success"}});
        metrics_->set_gauge("aggregation_price", price.value, {{"symbol", symbol}});
    }
    NEO_LOG_DEBUG("Aggregated {} = {} from {} sources ({} fetched, {} outliers)", symbol, price.value, surviving,
                  samples.size(), split.rejected.size());

    return Result<AggregatedPrice>::success(price);
}

std::vector<PriceSample> PriceAggregator::collect_samples(const std::string& symbol) {
    auto timeout = std::chrono::milliseconds(config_.default_timeout_ms);

    struct PendingFetch {
        std::string name;
        double weight;
        std::future<std::chrono::steady_clock::time_point> started;
        std::future<double> result;
    };

    std::vector<PendingFetch> pending;
    pending.reserve(sources_.size());

    for (const auto& entry : sources_) {
        if (!entry.source) {
            continue;
        }
        std::string name = "<unnamed>";
        try {
            auto source = entry.source;
            name = source->name();
            double weight = entry.weight.value_or(config_.default_weight);

            auto started = std::make_shared<std::promise<std::chrono::steady_clock::time_point>>();
            auto started_at = started->get_future();
            auto result = fetch_pool_.submit([source, symbol, timeout, started]() {
                started->set_value(std::chrono::steady_clock::now());
                return source->fetch_price(symbol, timeout);
            });
            pending.push_back(PendingFetch{name, weight, std::move(started_at), std::move(result)});
        } catch (const std::exception& e) {
            record_failure(symbol, name, e.what());
        }
    }

    std::vector<PriceSample> samples;
    samples.reserve(pending.size());

    for (auto& fetch : pending) {
        try {
            // A fetch's clock starts when a worker picks it up; time spent queued does not count.
            // Sources honor their timeout, so the queue always drains.
            auto deadline = fetch.started.get() + timeout;
            if (fetch.result.wait_until(deadline) != std::future_status::ready) {
                // Abandoned, not awaited
                record_failure(symbol, fetch.name, "timed out after " + std::to_string(timeout.count()) + " ms");
                continue;
            }

            double value = fetch.result.get();
            if (!std::isfinite(value) || value <= 0.0) {
                record_failure(symbol, fetch.name, "invalid price " + std::to_string(value));
                continue;
            }
            samples.push_back(PriceSample{fetch.name, value, fetch.weight});
        } catch (const std::exception& e) {
            record_failure(symbol, fetch.name, e.what());
        }
    }

    return samples;
}

void PriceAggregator::record_failure(const std::string& symbol, const std::string& source,
                                     const std::string& reason) {
    NEO_LOG_WARN("Price source {} failed for {}: {}", source, symbol, reason);
    if (metrics_) {
        metrics_->increment_counter("aggregation_source_failures_total", {{"symbol", symbol}, {"source", source}});
    }
}

} // namespace neo
