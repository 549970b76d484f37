#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <utility>

#include "interval.hpp"

namespace worktime {

struct CivilDate {
    int      year  = 1970;
    unsigned month = 1;
    unsigned day   = 1;
};

inline bool operator==(const CivilDate& a, const CivilDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CivilDate& a, const CivilDate& b) { return !(a == b); }

int       days_from_civil(int year, unsigned month, unsigned day);
CivilDate civil_from_days(int z);
CivilDate add_days(const CivilDate& date, int days);

// 0 = Monday ... 6 = Sunday.
int iso_weekday(const CivilDate& date);

std::tm   local_tm(Instant t);
CivilDate local_date(Instant t);

// Instant of the given local wall-clock time, resolved with the UTC offset in
// effect on that date (mktime with tm_isdst = -1).
Instant local_instant(const CivilDate& date, int hour = 0, int minute = 0);

std::string format_local(Instant t, const char* fmt);

// "HH:MM"; hours are not wrapped at 24.
std::string format_hhmm(Duration d);

// UTC, "YYYY-MM-DDTHH:MM:SS+00:00".
std::string format_iso_utc(Instant t);

// Accepts "YYYY-MM-DD[T| ]HH:MM[:SS[.frac]][Z|+HH:MM|-HH:MM]"; a missing
// offset means UTC.
std::optional<Instant> parse_iso8601(const std::string& text);

// "H:MM" / "HH:MM" with hour 0-23 and minute 0-59.
std::optional<std::pair<int, int>> parse_time_of_day(const std::string& text);

} // namespace worktime
