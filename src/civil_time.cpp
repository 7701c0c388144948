#include "civil_time.h"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace {
std::tm split_time(TimePoint tp, bool utc) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (utc) {
        gmtime_r(&tt, &tm);
    } else {
        localtime_r(&tt, &tm);
    }
    return tm;
}

bool read_digits(std::string_view s, std::size_t pos, std::size_t n, int &out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}
}

CivilTime to_civil_time(TimePoint tp, bool utc) {
    std::tm tm = split_time(tp, utc);
    CivilTime ct;
    ct.year = tm.tm_year + 1900;
    ct.month = tm.tm_mon + 1;
    ct.day = tm.tm_mday;
    ct.hour = tm.tm_hour;
    ct.minute = tm.tm_min;
    ct.second = tm.tm_sec;
    ct.weekday = (tm.tm_wday + 6) % 7; // tm_wday is 0=Sunday
    return ct;
}

bool same_calendar_minute(const CivilTime &a, const CivilTime &b) {
    return a.year == b.year && a.month == b.month && a.day == b.day && a.hour == b.hour && a.minute == b.minute;
}

std::string format_timestamp(TimePoint tp, bool utc) {
    std::tm tm = split_time(tp, utc);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf);
    if (utc) out += "+00:00";
    return out;
}

std::string format_date(TimePoint tp, bool utc) {
    std::tm tm = split_time(tp, utc);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::optional<TimePoint> parse_timestamp(std::string_view text) {
    // 2026-10-19T07:00:00[.ffffff][Z|+HH:MM|-HH:MM]
    std::tm tm{};
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    if (!read_digits(text, 0, 4, year) || text.size() < 19 || text[4] != '-' || !read_digits(text, 5, 2, mon) ||
        text[7] != '-' || !read_digits(text, 8, 2, day) || (text[10] != 'T' && text[10] != ' ') ||
        !read_digits(text, 11, 2, hour) || text[13] != ':' || !read_digits(text, 14, 2, min) || text[16] != ':' ||
        !read_digits(text, 17, 2, sec)) {
        return std::nullopt;
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) return std::nullopt;

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    }
    long offset_sec = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' && pos + 1 == text.size()) {
            offset_sec = 0;
        } else if (sign == '+' || sign == '-') {
            int oh = 0, om = 0;
            if (!read_digits(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
                !read_digits(text, pos + 4, 2, om) || pos + 6 != text.size()) {
                return std::nullopt;
            }
            offset_sec = (oh * 3600L + om * 60L) * (sign == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t tt = timegm(&tm);
    return std::chrono::system_clock::from_time_t(tt - offset_sec);
}
