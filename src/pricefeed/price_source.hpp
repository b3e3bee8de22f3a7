#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace neo {

// One external price provider. fetch_price must give up after `timeout`; it throws
// SourceError (SourceTimeout or SourceFailure) instead of returning a bad value.
class PriceSource {
public:
    virtual ~PriceSource() = default;
    virtual std::string name() const = 0;
    virtual double fetch_price(const std::string& symbol, std::chrono::milliseconds timeout) = 0;
};

struct WeightedSource {
    std::shared_ptr<PriceSource> source;
    std::optional<double> weight; // unset -> default weight
};

} // namespace neo
