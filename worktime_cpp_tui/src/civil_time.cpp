#include "civil_time.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace worktime {

namespace {

bool all_digits(const std::string& s, size_t pos, size_t count) {
    if (pos + count > s.size()) {
        return false;
    }
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

int digits_at(const std::string& s, size_t pos, size_t count) {
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        v = v * 10 + (s[i] - '0');
    }
    return v;
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace

int days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int>(doe) - 719468;
}

CivilDate civil_from_days(int z) {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int year = static_cast<int>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned day = doy - (153 * mp + 2) / 5 + 1;
    const unsigned month = mp + (mp < 10 ? 3 : static_cast<unsigned>(-9));
    year += month <= 2;
    return {year, month, day};
}

CivilDate add_days(const CivilDate& date, int days) {
    return civil_from_days(days_from_civil(date.year, date.month, date.day) + days);
}

int iso_weekday(const CivilDate& date) {
    // 1970-01-01 was a Thursday (3 when Monday is 0).
    const int z = days_from_civil(date.year, date.month, date.day);
    return static_cast<int>(((static_cast<int64_t>(z) % 7) + 7 + 3) % 7);
}

std::tm local_tm(Instant t) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tmv{};
#if defined(_WIN32)
    localtime_s(&tmv, &tt);
#else
    localtime_r(&tt, &tmv);
#endif
    return tmv;
}

CivilDate local_date(Instant t) {
    const std::tm tmv = local_tm(t);
    return {tmv.tm_year + 1900, static_cast<unsigned>(tmv.tm_mon + 1), static_cast<unsigned>(tmv.tm_mday)};
}

Instant local_instant(const CivilDate& date, int hour, int minute) {
    std::tm tmv{};
    tmv.tm_year = date.year - 1900;
    tmv.tm_mon = static_cast<int>(date.month) - 1;
    tmv.tm_mday = static_cast<int>(date.day);
    tmv.tm_hour = hour;
    tmv.tm_min = minute;
    tmv.tm_isdst = -1;
    tmv.tm_wday = -1;
    const std::time_t tt = std::mktime(&tmv);
    if (tt == static_cast<std::time_t>(-1) && tmv.tm_wday == -1) {
        throw std::range_error("local time out of range");
    }
    return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::from_time_t(tt));
}

std::string format_local(Instant t, const char* fmt) {
    const std::tm tmv = local_tm(t);
    std::ostringstream oss;
    oss << std::put_time(&tmv, fmt);
    return oss.str();
}

std::string format_hhmm(Duration d) {
    const long long total_minutes = std::max<long long>(0, d.count()) / 60;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld", total_minutes / 60, total_minutes % 60);
    return buf;
}

std::string format_iso_utc(Instant t) {
    const int64_t secs = t.time_since_epoch().count();
    const int64_t days = floor_div(secs, 86400);
    const int64_t rem = secs - days * 86400;
    const CivilDate date = civil_from_days(static_cast<int>(days));
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d+00:00",
                  date.year, date.month, date.day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return buf;
}

std::optional<Instant> parse_iso8601(const std::string& text) {
    const std::string& s = text;
    if (!all_digits(s, 0, 4) || s.size() < 16 || s[4] != '-' || !all_digits(s, 5, 2) || s[7] != '-' ||
        !all_digits(s, 8, 2) || (s[10] != 'T' && s[10] != ' ') || !all_digits(s, 11, 2) || s[13] != ':' ||
        !all_digits(s, 14, 2)) {
        return std::nullopt;
    }
    const int year = digits_at(s, 0, 4);
    const int month = digits_at(s, 5, 2);
    const int day = digits_at(s, 8, 2);
    const int hour = digits_at(s, 11, 2);
    const int minute = digits_at(s, 14, 2);
    int second = 0;
    size_t pos = 16;
    if (pos < s.size() && s[pos] == ':') {
        if (!all_digits(s, pos + 1, 2)) {
            return std::nullopt;
        }
        second = digits_at(s, pos + 1, 2);
        pos += 3;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            const size_t frac_start = pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                ++pos;
            }
            if (pos == frac_start) {
                return std::nullopt;
            }
        }
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int offset_minutes = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z' && pos + 1 == s.size()) {
            pos += 1;
        } else if ((s[pos] == '+' || s[pos] == '-') && pos + 6 == s.size() && all_digits(s, pos + 1, 2) &&
                   s[pos + 3] == ':' && all_digits(s, pos + 4, 2)) {
            const int sign = s[pos] == '-' ? -1 : 1;
            offset_minutes = sign * (digits_at(s, pos + 1, 2) * 60 + digits_at(s, pos + 4, 2));
            pos += 6;
        } else {
            return std::nullopt;
        }
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
    return Instant(Duration(secs));
}

std::optional<std::pair<int, int>> parse_time_of_day(const std::string& text) {
    const size_t colon = text.find(':');
    if (colon == std::string::npos || colon < 1 || colon > 2 || text.size() != colon + 3) {
        return std::nullopt;
    }
    if (!all_digits(text, 0, colon) || !all_digits(text, colon + 1, 2)) {
        return std::nullopt;
    }
    const int hour = digits_at(text, 0, colon);
    const int minute = digits_at(text, colon + 1, 2);
    if (hour > 23 || minute > 59) {
        return std::nullopt;
    }
    return std::make_pair(hour, minute);
}

} // namespace worktime
