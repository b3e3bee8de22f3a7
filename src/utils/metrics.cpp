#include "metrics.hpp"
#include "logger.hpp"
#include <sstream>

namespace neo {

void MetricsRegistry::increment_counter(const std::string& name, const MetricLabels& labels, double amount) {
    std::string key = make_key(name, labels);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[key] += amount;
    }
    NEO_LOG_TRACE("Counter incremented: {} by {}", key, amount);
}

void MetricsRegistry::set_gauge(const std::string& name, double value, const MetricLabels& labels) {
    std::string key = make_key(name, labels);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[key] = value;
    }
    NEO_LOG_TRACE("Gauge set: {} = {}", key, value);
}

double MetricsRegistry::counter(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(make_key(name, labels));
    return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gauge(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(make_key(name, labels));
    return it == gauges_.end() ? 0.0 : it->second;
}

nlohmann::json MetricsRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nlohmann::json{{"counters", counters_}, {"gauges", gauges_}};
}

void MetricsRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
}

// Prometheus-style key: name{a="1",b="2"}
std::string MetricsRegistry::make_key(const std::string& name, const MetricLabels& labels) {
    if (labels.empty()) {
        return name;
    }

    std::ostringstream key;
    key << name << '{';
    bool first = true;
    for (const auto& [label, value] : labels) {
        if (!first) {
            key << ',';
        }
        key << label << "=\"" << value << '"';
        first = false;
    }
    key << '}';
    return key.str();
}

} // namespace neo
