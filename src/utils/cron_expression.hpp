#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>

namespace neo {

enum class CronTimezone {
    Local,
    Utc
};

class CronParseError : public std::invalid_argument {
public:
    explicit CronParseError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Cron schedule in the 5-field (min hour dom month dow) or 6-field (sec min hour dom month dow)
// form, or one of the @-descriptors including "@every <duration>".
class CronExpression {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // Throws CronParseError
    static CronExpression parse(const std::string& expression, CronTimezone timezone = CronTimezone::Local);

    // First activation strictly after `after`; nullopt if none within five years
    std::optional<TimePoint> next(TimePoint after) const;

    // True when the second containing `tp` is an activation instant. Always false for @every.
    bool matches(TimePoint tp) const;

    const std::string& expression() const { return expression_; }
    CronTimezone timezone() const { return timezone_; }
    bool is_interval() const { return interval_.count() > 0; }
    std::chrono::seconds interval() const { return interval_; }

private:
    CronExpression() = default;

    bool day_matches(const std::tm& tm) const;
    bool fields_match(const std::tm& tm) const;
    std::tm to_tm(std::time_t t) const;
    std::time_t to_time_t(std::tm& tm) const;

    std::string expression_;
    CronTimezone timezone_ = CronTimezone::Local;
    uint64_t seconds_ = 0;
    uint64_t minutes_ = 0;
    uint64_t hours_ = 0;
    uint64_t days_of_month_ = 0;
    uint64_t months_ = 0;
    uint64_t days_of_week_ = 0;
    bool dom_restricted_ = false;
    bool dow_restricted_ = false;
    std::chrono::seconds interval_{0};
};

} // namespace neo
