#pragma once

#include <memory>
#include <string>
#include <vector>
#include "price_source.hpp"
#include "../network/rest_client.hpp"
#include "../utils/config_types.hpp"

namespace neo {

// Price source backed by a JSON HTTP endpoint. The endpoint may contain {symbol} and
// {symbol_lower}; the price is read at price_path, a JSON pointer, as a number or numeric string.
class HttpPriceSource : public PriceSource {
public:
    HttpPriceSource(SourceConfig config, std::shared_ptr<RestClient> client);

    std::string name() const override { return config_.name; }
    double fetch_price(const std::string& symbol, std::chrono::milliseconds timeout) override;

    std::string build_url(const std::string& symbol) const;

    // Throws SourceError(SourceFailure)
    double extract_price(const std::string& body) const;

private:
    SourceConfig config_;
    std::shared_ptr<RestClient> client_;
};

std::vector<WeightedSource> create_sources(const PriceFeedConfig& config, std::shared_ptr<RestClient> client);

} // namespace neo
