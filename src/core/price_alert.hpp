#pragma once

#include <string>
#include "types.hpp"

namespace neo {

// Parses "SYMBOL above|below THRESHOLD" (exactly three whitespace-separated tokens).
// Throws InvalidConditionError.
PriceAlertCondition parse_price_condition(const std::string& text);

// Inverse of parse_price_condition
std::string format_price_condition(const PriceAlertCondition& condition);

// Strict comparison: a price equal to the threshold never matches
bool evaluate(const PriceAlertCondition& condition, double price);

} // namespace neo
