#include "time_window.hpp"

#include "civil_time.hpp"

namespace worktime {

Window day_window(Instant now) {
    const CivilDate today = local_date(now);
    return {local_instant(today), local_instant(add_days(today, 1))};
}

Window week_window(Instant now, WeekStart first) {
    const CivilDate today = local_date(now);
    int back = iso_weekday(today);
    if (first == WeekStart::Sunday) {
        back = (back + 1) % 7;
    }
    const CivilDate start = add_days(today, -back);
    return {local_instant(start), local_instant(add_days(start, 7))};
}

} // namespace worktime
