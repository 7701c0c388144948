#pragma once

#include "job.h"

#include <optional>
#include <string>
#include <string_view>

// Broken-down calendar time. weekday is ISO-style: 0=Monday ... 6=Sunday.
struct CivilTime {
    int year{1970};
    int month{1};   // 1-12
    int day{1};     // 1-31
    int hour{0};
    int minute{0};
    int second{0};
    int weekday{3};
};

CivilTime to_civil_time(TimePoint tp, bool utc);

// Classic cron numbering, 0=Sunday ... 6=Saturday.
inline int cron_day_of_week(int iso_weekday) { return (iso_weekday + 1) % 7; }

bool same_calendar_minute(const CivilTime &a, const CivilTime &b);

// YYYY-MM-DDTHH:MM:SS, suffixed with +00:00 for UTC.
std::string format_timestamp(TimePoint tp, bool utc);
std::string format_date(TimePoint tp, bool utc);

// Accepts YYYY-MM-DDTHH:MM:SS with optional fractional seconds and an optional
// Z / +HH:MM / -HH:MM suffix. Timestamps without an offset are taken as UTC.
std::optional<TimePoint> parse_timestamp(std::string_view text);
