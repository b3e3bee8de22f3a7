#pragma once

#include <string>
#include <vector>

namespace neo {

struct PriceSample {
    std::string source;
    double value = 0.0;
    double weight = 1.0;
};

struct OutlierSplit {
    std::vector<PriceSample> accepted;
    std::vector<PriceSample> rejected;
    double median = 0.0;
};

// Throws std::invalid_argument on an empty input
double median(std::vector<double> values);

// |value - reference| / |reference|, or |value| when the reference is zero
double relative_deviation(double value, double reference);

// Splits samples around their median. threshold <= 0 accepts everything.
OutlierSplit reject_outliers(const std::vector<PriceSample>& samples, double threshold);

// Sum(w * v) / Sum(w). Throws std::invalid_argument on an empty input or a non-positive total weight.
double weighted_average(const std::vector<PriceSample>& samples);

} // namespace neo
