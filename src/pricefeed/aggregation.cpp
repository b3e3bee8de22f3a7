#include "aggregation.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace neo {

double median(std::vector<double> values) {
    if (values.empty()) {
        throw std::invalid_argument("median of an empty sample set");
    }

    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

double relative_deviation(double value, double reference) {
    if (reference == 0.0) {
        return std::abs(value);
    }
    return std::abs(value - reference) / std::abs(reference);
}

OutlierSplit reject_outliers(const std::vector<PriceSample>& samples, double threshold) {
    OutlierSplit split;
    if (samples.empty()) {
        return split;
    }

    std::vector<double> values;
    values.reserve(samples.size());
    for (const auto& sample : samples) {
        values.push_back(sample.value);
    }
    split.median = median(std::move(values));

    for (const auto& sample : samples) {
        if (threshold > 0.0 && relative_deviation(sample.value, split.median) > threshold) {
            split.rejected.push_back(sample);
        } else {
            split.accepted.push_back(sample);
        }
    }
    return split;
}

double weighted_average(const std::vector<PriceSample>& samples) {
    if (samples.empty()) {
        throw std::invalid_argument("weighted average of an empty sample set");
    }

    double weighted_sum = 0.0;
    double total_weight = 0.0;
    for (const auto& sample : samples) {
        weighted_sum += sample.value * sample.weight;
        total_weight += sample.weight;
    }

    if (!(total_weight > 0.0)) {
        throw std::invalid_argument("total sample weight must be positive");
    }
    return weighted_sum / total_weight;
}

} // namespace neo
