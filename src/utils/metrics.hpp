#pragma once

#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace neo {

using MetricLabels = std::map<std::string, std::string>;

// In-process counters and gauges. Exporting them is left to whoever reads snapshot().
class MetricsRegistry {
public:
    void increment_counter(const std::string& name, const MetricLabels& labels = {}, double amount = 1.0);
    void set_gauge(const std::string& name, double value, const MetricLabels& labels = {});

    double counter(const std::string& name, const MetricLabels& labels = {}) const;
    double gauge(const std::string& name, const MetricLabels& labels = {}) const;

    nlohmann::json snapshot() const;
    void reset();

private:
    static std::string make_key(const std::string& name, const MetricLabels& labels);

    mutable std::mutex mutex_;
    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
};

} // namespace neo
