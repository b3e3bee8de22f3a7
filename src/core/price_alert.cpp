#include "price_alert.hpp"
#include "exceptions.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace neo {

PriceAlertCondition parse_price_condition(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> parts;
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }

    if (parts.size() != 3) {
        throw InvalidConditionError("expected 'SYMBOL above|below THRESHOLD', got '" + text + "'");
    }

    PriceAlertCondition condition;
    condition.symbol = parts[0];

    if (parts[1] == "above") {
        condition.comparison = Comparison::Above;
    } else if (parts[1] == "below") {
        condition.comparison = Comparison::Below;
    } else {
        throw InvalidConditionError("comparison must be 'above' or 'below', got '" + parts[1] + "'");
    }

    const char* begin = parts[2].c_str();
    char* end = nullptr;
    errno = 0;
    double threshold = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(threshold)) {
        throw InvalidConditionError("threshold is not a number: '" + parts[2] + "'");
    }
    condition.threshold = threshold;

    return condition;
}

std::string format_price_condition(const PriceAlertCondition& condition) {
    return fmt::format("{} {} {}", condition.symbol, to_string(condition.comparison), condition.threshold);
}

bool evaluate(const PriceAlertCondition& condition, double price) {
    switch (condition.comparison) {
        case Comparison::Above: return price > condition.threshold;
        case Comparison::Below: return price < condition.threshold;
    }
    return false;
}

} // namespace neo
