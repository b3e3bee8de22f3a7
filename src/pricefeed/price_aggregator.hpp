#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include "aggregation.hpp"
#include "price_source.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "../data/price_cache.hpp"
#include "../utils/config_types.hpp"
#include "../utils/metrics.hpp"
#include "../utils/thread_pool.hpp"

namespace neo {

// Runs aggregation cycles: fan out to every source, drop failures and outliers, and publish
// the weighted average only when at least min_valid_sources samples survive.
class PriceAggregator {
public:
    PriceAggregator(PriceFeedConfig config, std::vector<WeightedSource> sources, std::shared_ptr<PriceCache> cache,
                    std::shared_ptr<MetricsRegistry> metrics = nullptr);

    // One cycle for `symbol`. On InsufficientQuorum the cached value is left untouched.
    Result<AggregatedPrice> aggregate(const std::string& symbol);

    bool is_supported(const std::string& symbol) const;

    const PriceFeedConfig& config() const { return config_; }
    size_t source_count() const { return sources_.size(); }
    std::shared_ptr<PriceCache> cache() const { return cache_; }

private:
    std::vector<PriceSample> collect_samples(const std::string& symbol);
    void record_failure(const std::string& symbol, const std::string& source, const std::string& reason);

    PriceFeedConfig config_;
    std::vector<WeightedSource> sources_;
    std::unordered_set<std::string> supported_;
    std::shared_ptr<PriceCache> cache_;
    std::shared_ptr<MetricsRegistry> metrics_;
    ThreadPool fetch_pool_;
};

} // namespace neo
