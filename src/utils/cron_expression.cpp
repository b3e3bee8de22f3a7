#include "cron_expression.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace neo {

namespace {

struct FieldSpec {
    const char* name;
    int min;
    int max;
    const std::unordered_map<std::string, int>* names;
};

const std::unordered_map<std::string, int> kMonthNames = {
    {"JAN", 1}, {"FEB", 2}, {"MAR", 3}, {"APR", 4}, {"MAY", 5}, {"JUN", 6},
    {"JUL", 7}, {"AUG", 8}, {"SEP", 9}, {"OCT", 10}, {"NOV", 11}, {"DEC", 12}
};

const std::unordered_map<std::string, int> kDayNames = {
    {"SUN", 0}, {"MON", 1}, {"TUE", 2}, {"WED", 3}, {"THU", 4}, {"FRI", 5}, {"SAT", 6}
};

const FieldSpec kSeconds{"second", 0, 59, nullptr};
const FieldSpec kMinutes{"minute", 0, 59, nullptr};
const FieldSpec kHours{"hour", 0, 23, nullptr};
const FieldSpec kDaysOfMonth{"day-of-month", 1, 31, nullptr};
const FieldSpec kMonths{"month", 1, 12, &kMonthNames};
const FieldSpec kDaysOfWeek{"day-of-week", 0, 7, &kDayNames}; // 7 folds onto Sunday

const std::unordered_map<std::string, std::string> kDescriptors = {
    {"@yearly", "0 0 0 1 1 *"},
    {"@annually", "0 0 0 1 1 *"},
    {"@monthly", "0 0 0 1 * *"},
    {"@weekly", "0 0 0 * * 0"},
    {"@daily", "0 0 0 * * *"},
    {"@midnight", "0 0 0 * * *"},
    {"@hourly", "0 0 * * * *"}
};

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

int parse_value(const std::string& token, const FieldSpec& spec) {
    if (token.empty()) {
        throw CronParseError(std::string("empty value in ") + spec.name + " field");
    }

    if (spec.names) {
        auto it = spec.names->find(to_upper(token));
        if (it != spec.names->end()) {
            return it->second;
        }
    }

    if (!std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw CronParseError("invalid " + std::string(spec.name) + " value '" + token + "'");
    }
    if (token.size() > 4) {
        throw CronParseError(std::string(spec.name) + " value out of range: " + token);
    }

    int value = std::stoi(token);
    if (value < spec.min || value > spec.max) {
        throw CronParseError(std::string(spec.name) + " value out of range: " + token);
    }
    return value;
}

uint64_t parse_field(const std::string& field, const FieldSpec& spec) {
    if (field.empty()) {
        throw CronParseError(std::string("empty ") + spec.name + " field");
    }

    uint64_t mask = 0;
    for (const auto& part : split(field, ',')) {
        if (part.empty()) {
            throw CronParseError(std::string("empty list entry in ") + spec.name + " field");
        }

        std::string range = part;
        int step = 1;
        bool has_step = false;

        auto slash = part.find('/');
        if (slash != std::string::npos) {
            range = part.substr(0, slash);
            std::string step_text = part.substr(slash + 1);
            if (step_text.empty() || step_text.size() > 4 ||
                !std::all_of(step_text.begin(), step_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
                throw CronParseError("invalid step '" + step_text + "' in " + spec.name + " field");
            }
            step = std::stoi(step_text);
            if (step <= 0) {
                throw CronParseError(std::string("step must be positive in ") + spec.name + " field");
            }
            has_step = true;
        }

        int low = spec.min;
        int high = spec.max;
        if (range == "*" || range == "?") {
            // full range
        } else {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                low = parse_value(range.substr(0, dash), spec);
                high = parse_value(range.substr(dash + 1), spec);
            } else {
                low = parse_value(range, spec);
                high = has_step ? spec.max : low;
            }
        }

        if (low > high) {
            throw CronParseError("range " + range + " is reversed in " + spec.name + " field");
        }

        for (int value = low; value <= high; value += step) {
            mask |= (uint64_t{1} << value);
        }
    }
    return mask;
}

bool is_unrestricted(const std::string& field) {
    return !field.empty() && (field[0] == '*' || field[0] == '?');
}

std::chrono::seconds parse_every(const std::string& text) {
    if (text.empty()) {
        throw CronParseError("@every requires a duration");
    }

    long long total = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t digits_end = pos;
        while (digits_end < text.size() && std::isdigit(static_cast<unsigned char>(text[digits_end]))) {
            ++digits_end;
        }
        if (digits_end == pos || digits_end == text.size() || digits_end - pos > 9) {
            throw CronParseError("invalid duration '" + text + "'");
        }
        long long amount = std::stoll(text.substr(pos, digits_end - pos));
        switch (text[digits_end]) {
            case 'h': total += amount * 3600; break;
            case 'm': total += amount * 60; break;
            case 's': total += amount; break;
            default:
                throw CronParseError("invalid duration unit in '" + text + "'");
        }
        pos = digits_end + 1;
    }

    if (total <= 0) {
        throw CronParseError("@every duration must be at least one second");
    }
    return std::chrono::seconds(total);
}

bool has_bit(uint64_t mask, int bit) {
    return (mask >> bit) & uint64_t{1};
}

} // namespace

CronExpression CronExpression::parse(const std::string& expression, CronTimezone timezone) {
    CronExpression cron;
    cron.timezone_ = timezone;

    std::istringstream stream(expression);
    std::vector<std::string> fields;
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }

    if (fields.empty()) {
        throw CronParseError("empty schedule expression");
    }

    cron.expression_ = fields[0];
    for (size_t i = 1; i < fields.size(); ++i) {
        cron.expression_ += " " + fields[i];
    }

    if (fields[0][0] == '@') {
        std::string descriptor = to_lower(fields[0]);
        if (descriptor == "@every") {
            if (fields.size() != 2) {
                throw CronParseError("@every takes exactly one duration");
            }
            cron.interval_ = parse_every(to_lower(fields[1]));
            return cron;
        }

        auto it = kDescriptors.find(descriptor);
        if (it == kDescriptors.end() || fields.size() != 1) {
            throw CronParseError("unrecognized descriptor '" + fields[0] + "'");
        }

        std::istringstream expanded(it->second);
        fields.clear();
        while (expanded >> field) {
            fields.push_back(field);
        }
    }

    if (fields.size() == 5) {
        fields.insert(fields.begin(), "0");
    } else if (fields.size() != 6) {
        throw CronParseError("expected 5 or 6 fields, found " + std::to_string(fields.size()));
    }

    cron.seconds_ = parse_field(fields[0], kSeconds);
    cron.minutes_ = parse_field(fields[1], kMinutes);
    cron.hours_ = parse_field(fields[2], kHours);
    cron.days_of_month_ = parse_field(fields[3], kDaysOfMonth);
    cron.months_ = parse_field(fields[4], kMonths);
    cron.days_of_week_ = parse_field(fields[5], kDaysOfWeek);

    if (has_bit(cron.days_of_week_, 7)) {
        cron.days_of_week_ = (cron.days_of_week_ & ~(uint64_t{1} << 7)) | uint64_t{1};
    }

    cron.dom_restricted_ = !is_unrestricted(fields[3]);
    cron.dow_restricted_ = !is_unrestricted(fields[5]);
    return cron;
}

std::optional<CronExpression::TimePoint> CronExpression::next(TimePoint after) const {
    std::time_t start = Clock::to_time_t(std::chrono::time_point_cast<std::chrono::seconds>(after));
    if (Clock::from_time_t(start) > after) {
        --start; // to_time_t may round up
    }

    if (is_interval()) {
        return Clock::from_time_t(start) + interval_;
    }

    std::tm tm = to_tm(start + 1);
    const int max_year = tm.tm_year + 5;

    // Bounded so a pathological local-time normalization cannot spin forever
    for (int iteration = 0; iteration < 500000 && tm.tm_year <= max_year; ++iteration) {
        if (!has_bit(months_, tm.tm_mon + 1)) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            tm.tm_sec = 0;
        } else if (!day_matches(tm)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            tm.tm_sec = 0;
        } else if (!has_bit(hours_, tm.tm_hour)) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
            tm.tm_sec = 0;
        } else if (!has_bit(minutes_, tm.tm_min)) {
            tm.tm_min += 1;
            tm.tm_sec = 0;
        } else if (!has_bit(seconds_, tm.tm_sec)) {
            tm.tm_sec += 1;
        } else {
            return Clock::from_time_t(to_time_t(tm));
        }
        tm = to_tm(to_time_t(tm));
    }

    return std::nullopt;
}

bool CronExpression::matches(TimePoint tp) const {
    if (is_interval()) {
        return false;
    }
    std::tm tm = to_tm(Clock::to_time_t(std::chrono::time_point_cast<std::chrono::seconds>(tp)));
    return fields_match(tm);
}

bool CronExpression::day_matches(const std::tm& tm) const {
    bool dom = has_bit(days_of_month_, tm.tm_mday);
    bool dow = has_bit(days_of_week_, tm.tm_wday);
    if (dom_restricted_ && dow_restricted_) {
        return dom || dow;
    }
    return dom && dow;
}

bool CronExpression::fields_match(const std::tm& tm) const {
    return has_bit(months_, tm.tm_mon + 1) && day_matches(tm) && has_bit(hours_, tm.tm_hour) &&
           has_bit(minutes_, tm.tm_min) && has_bit(seconds_, tm.tm_sec);
}

std::tm CronExpression::to_tm(std::time_t t) const {
    std::tm tm{};
    if (timezone_ == CronTimezone::Utc) {
        gmtime_r(&t, &tm);
    } else {
        localtime_r(&t, &tm);
    }
    return tm;
}

std::time_t CronExpression::to_time_t(std::tm& tm) const {
    if (timezone_ == CronTimezone::Utc) {
        return timegm(&tm);
    }
    tm.tm_isdst = -1;
    return mktime(&tm);
}

} // namespace neo
