#include "price_cache.hpp"
#include "../utils/logger.hpp"
#include <mutex>

namespace neo {

bool PriceCache::get_price(const std::string& symbol, AggregatedPrice& price) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
        return false;
    }
    price = it->second;
    return true;
}

std::map<std::string, AggregatedPrice> PriceCache::get_all_prices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return prices_;
}

void PriceCache::update(const AggregatedPrice& price) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        prices_[price.symbol] = price;
    }
    NEO_LOG_TRACE("Price cache updated: {} = {}", price.symbol, price.value);
}

bool PriceCache::remove(const std::string& symbol) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return prices_.erase(symbol) > 0;
}

void PriceCache::clear() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        prices_.clear();
    }
    NEO_LOG_INFO("Price cache cleared");
}

bool PriceCache::is_stale(const std::string& symbol, std::chrono::milliseconds max_age) const {
    AggregatedPrice price;
    if (!get_price(symbol, price)) {
        return true; // No price data is considered stale
    }
    return std::chrono::system_clock::now() - price.computed_at > max_age;
}

std::vector<std::string> PriceCache::cached_symbols() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> symbols;
    symbols.reserve(prices_.size());
    for (const auto& entry : prices_) {
        symbols.push_back(entry.first);
    }
    return symbols;
}

size_t PriceCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return prices_.size();
}

} // namespace neo
