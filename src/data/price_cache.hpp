#pragma once

#include <chrono>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include "../core/price_cache_reader.hpp"

namespace neo {

// Last accepted AggregatedPrice per symbol. Writers replace the whole value, so readers
// never see a partially updated entry.
class PriceCache : public PriceCacheReader {
public:
    bool get_price(const std::string& symbol, AggregatedPrice& price) const override;

    // One consistent snapshot taken under a single read lock
    std::map<std::string, AggregatedPrice> get_all_prices() const override;

    void update(const AggregatedPrice& price);
    bool remove(const std::string& symbol);
    void clear();

    // Missing entries count as stale
    bool is_stale(const std::string& symbol, std::chrono::milliseconds max_age) const;

    std::vector<std::string> cached_symbols() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, AggregatedPrice> prices_;
};

} // namespace neo
