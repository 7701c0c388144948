#include "cron_expression.h"

#include <cctype>
#include <charconv>
#include <ctime>
#include <sstream>
#include <vector>

namespace {
constexpr int kMaxMinute = 59;
constexpr int kMaxHour = 23;
constexpr int kMaxDay = 31;
constexpr int kMaxMonth = 12;
constexpr int kMaxWeekday = 6;
constexpr int kSearchDays = 366 * 4 + 1;

int parse_int(std::string_view token, std::string_view field) {
    bool digits = !token.empty();
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            digits = false;
            break;
        }
    }
    int v = 0;
    if (digits) {
        auto res = std::from_chars(token.data(), token.data() + token.size(), v);
        if (res.ec == std::errc() && res.ptr == token.data() + token.size()) return v;
    }
    throw ValidationError("invalid cron field '" + std::string(field) + "': bad number '" + std::string(token) + "'");
}

std::vector<std::string> split_fields(std::string_view expr) {
    std::vector<std::string> parts;
    std::istringstream iss{std::string(expr)};
    std::string part;
    while (iss >> part) parts.push_back(part);
    if (parts.size() != 5) {
        throw ValidationError("invalid cron expression (need 5 fields): '" + std::string(expr) + "'");
    }
    return parts;
}

template <std::size_t N>
void fill_mask(std::bitset<N> &mask, const std::string &field, int lo, int hi) {
    for (int v = lo; v <= hi; ++v) {
        mask.set(static_cast<std::size_t>(v), field_matches(field, v, hi));
    }
}

std::time_t make_time(std::tm &tm, bool utc) {
    if (utc) return timegm(&tm);
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}
}

bool field_matches(std::string_view expression, int value, int max_value) {
    if (expression == "*") return value <= max_value;

    if (auto slash = expression.find('/'); slash != std::string_view::npos) {
        auto base = expression.substr(0, slash);
        auto step_str = expression.substr(slash + 1);
        int step = parse_int(step_str, expression);
        if (step <= 0) {
            throw ValidationError("invalid cron field '" + std::string(expression) + "': step must be positive");
        }
        int base_val = base == "*" ? 0 : parse_int(base, expression);
        return value <= max_value && value >= base_val && (value - base_val) % step == 0;
    }

    if (expression.find(',') != std::string_view::npos) {
        bool hit = false;
        std::size_t start = 0;
        while (true) {
            auto comma = expression.find(',', start);
            auto token = expression.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
            if (parse_int(token, expression) == value) hit = true;
            if (comma == std::string_view::npos) break;
            start = comma + 1;
        }
        return hit && value <= max_value;
    }

    if (auto dash = expression.find('-'); dash != std::string_view::npos) {
        int lo = parse_int(expression.substr(0, dash), expression);
        int hi = parse_int(expression.substr(dash + 1), expression);
        return value <= max_value && lo <= value && value <= hi;
    }

    return value <= max_value && value == parse_int(expression, expression);
}

bool schedule_matches(std::string_view expression, const CivilTime &t) {
    auto f = split_fields(expression);
    return field_matches(f[0], t.minute, kMaxMinute) && field_matches(f[1], t.hour, kMaxHour) &&
           field_matches(f[2], t.day, kMaxDay) && field_matches(f[3], t.month, kMaxMonth) &&
           field_matches(f[4], cron_day_of_week(t.weekday), kMaxWeekday);
}

bool schedule_matches(std::string_view expression, TimePoint tp, bool utc) {
    return schedule_matches(expression, to_civil_time(tp, utc));
}

CronExpression CronExpression::parse(std::string_view expr) {
    auto parts = split_fields(expr);
    CronExpression ce;
    ce.raw = std::string(expr);
    for (std::size_t i = 0; i < parts.size(); ++i) ce.fields[i] = parts[i];
    fill_mask(ce.minutes_, ce.fields[0], 0, kMaxMinute);
    fill_mask(ce.hours_, ce.fields[1], 0, kMaxHour);
    fill_mask(ce.days_, ce.fields[2], 1, kMaxDay);
    fill_mask(ce.months_, ce.fields[3], 1, kMaxMonth);
    fill_mask(ce.weekdays_, ce.fields[4], 0, kMaxWeekday);
    return ce;
}

bool CronExpression::matches(const CivilTime &t) const {
    auto in = [](const auto &mask, int v) { return v >= 0 && static_cast<std::size_t>(v) < mask.size() && mask.test(static_cast<std::size_t>(v)); };
    return in(minutes_, t.minute) && in(hours_, t.hour) && in(days_, t.day) && in(months_, t.month) &&
           in(weekdays_, cron_day_of_week(t.weekday));
}

std::optional<TimePoint> CronExpression::next_run(TimePoint from, bool utc) const {
    if (minutes_.none() || hours_.none() || days_.none() || months_.none() || weekdays_.none()) return std::nullopt;

    auto tt = std::chrono::system_clock::to_time_t(from);
    std::tm start{};
    if (utc) {
        gmtime_r(&tt, &start);
    } else {
        localtime_r(&tt, &start);
    }
    start.tm_sec = 0;
    start.tm_min += 1;
    make_time(start, utc);

    for (int offset = 0; offset < kSearchDays; ++offset) {
        std::tm day = start;
        if (offset > 0) {
            day.tm_mday += offset;
            day.tm_hour = 0;
            day.tm_min = 0;
            make_time(day, utc);
        }
        if (!months_.test(static_cast<std::size_t>(day.tm_mon + 1)) || !days_.test(static_cast<std::size_t>(day.tm_mday)) ||
            !weekdays_.test(static_cast<std::size_t>(day.tm_wday))) {
            continue;
        }
        for (int h = day.tm_hour; h <= kMaxHour; ++h) {
            if (!hours_.test(static_cast<std::size_t>(h))) continue;
            int first_min = h == day.tm_hour ? day.tm_min : 0;
            for (int m = first_min; m <= kMaxMinute; ++m) {
                if (!minutes_.test(static_cast<std::size_t>(m))) continue;
                std::tm hit = day;
                hit.tm_hour = h;
                hit.tm_min = m;
                hit.tm_sec = 0;
                return std::chrono::system_clock::from_time_t(make_time(hit, utc));
            }
        }
    }
    return std::nullopt;
}
