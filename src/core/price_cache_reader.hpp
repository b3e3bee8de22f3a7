#pragma once

#include <map>
#include <string>
#include "types.hpp"

namespace neo {

// Read-only view of the aggregated prices, handed to consumers such as the price monitor
class PriceCacheReader {
public:
    virtual ~PriceCacheReader() = default;
    virtual bool get_price(const std::string& symbol, AggregatedPrice& price) const = 0;
    virtual std::map<std::string, AggregatedPrice> get_all_prices() const = 0;
};

} // namespace neo
