#pragma once

#include "civil_time.h"
#include "job.h"

#include <array>
#include <bitset>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// Malformed schedule expression or job definition.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// One cron field against one value. Supported forms, checked in order:
//   *            any value
//   base/step    base is * (0) or an integer; value >= base && (value-base) % step == 0
//   a,b,c        list of integers
//   lo-hi        inclusive range
//   n            exact value
// Values above max_value never match. Throws ValidationError when the field
// cannot be parsed.
bool field_matches(std::string_view expression, int value, int max_value);

// minute hour day-of-month month day-of-week. Day-of-week is 0=Sunday..6=Saturday,
// 7 is not an alias for Sunday.
bool schedule_matches(std::string_view expression, const CivilTime &t);
bool schedule_matches(std::string_view expression, TimePoint tp, bool utc = false);

struct CronExpression {
    std::string raw;
    std::array<std::string, 5> fields;

    // Throws ValidationError on anything but five well-formed fields.
    static CronExpression parse(std::string_view expr);

    bool matches(const CivilTime &t) const;

    // First matching minute strictly after `from`, searched up to four years ahead.
    std::optional<TimePoint> next_run(TimePoint from, bool utc) const;

private:
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_;    // index 1-31
    std::bitset<13> months_;  // index 1-12
    std::bitset<7> weekdays_; // 0=Sunday
};
