#include "http_price_source.hpp"
#include "../core/exceptions.hpp"
#include "../network/network_exception.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace neo {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.length(), to);
        pos += to.length();
    }
}

} // namespace

HttpPriceSource::HttpPriceSource(SourceConfig config, std::shared_ptr<RestClient> client)
    : config_(std::move(config)), client_(std::move(client)) {}

std::string HttpPriceSource::build_url(const std::string& symbol) const {
    std::string lower = symbol;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string url = config_.endpoint;
    replace_all(url, "{symbol_lower}", RestClient::UrlEncode(lower));
    replace_all(url, "{symbol}", RestClient::UrlEncode(symbol));
    return url;
}

double HttpPriceSource::fetch_price(const std::string& symbol, std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.url = build_url(symbol);
    request.timeout_ms = static_cast<long>(timeout.count());
    request.headers.insert(config_.headers.begin(), config_.headers.end());
    request.headers.emplace("Accept", "application/json");

    HttpResponse response;
    try {
        response = client_->Request(request);
    } catch (const TimeoutException& e) {
        throw SourceError(ErrorCode::SourceTimeout, config_.name, e.what());
    } catch (const NetworkException& e) {
        throw SourceError(ErrorCode::SourceFailure, config_.name, e.what());
    }

    if (!response.IsSuccess()) {
        throw SourceError(ErrorCode::SourceFailure, config_.name,
                          "unexpected HTTP status " + std::to_string(response.status_code));
    }

    return extract_price(response.body);
}

double HttpPriceSource::extract_price(const std::string& body) const {
    nlohmann::json value;
    try {
        nlohmann::json document = nlohmann::json::parse(body);
        value = document.at(nlohmann::json::json_pointer(config_.price_path));
    } catch (const nlohmann::json::exception& e) {
        throw SourceError(ErrorCode::SourceFailure, config_.name,
                          "cannot read price at '" + config_.price_path + "': " + e.what());
    }

    if (value.is_number()) {
        return value.get<double>();
    }

    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        const char* begin = text.c_str();
        char* end = nullptr;
        errno = 0;
        double parsed = std::strtod(begin, &end);
        if (end != begin && *end == '\0' && errno != ERANGE) {
            return parsed;
        }
    }

    throw SourceError(ErrorCode::SourceFailure, config_.name, "price at '" + config_.price_path + "' is not numeric");
}

std::vector<WeightedSource> create_sources(const PriceFeedConfig& config, std::shared_ptr<RestClient> client) {
    std::vector<WeightedSource> sources;
    sources.reserve(config.sources.size());
    for (const auto& source_config : config.sources) {
        sources.push_back(WeightedSource{std::make_shared<HttpPriceSource>(source_config, client), source_config.weight});
        NEO_LOG_INFO("Configured price source {} (weight {})", source_config.name,
                     source_config.weight.value_or(config.default_weight));
    }
    return sources;
}

} // namespace neo
