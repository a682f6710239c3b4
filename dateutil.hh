/* Date utilities: wall-clock day and hour-of-day bucketing of trace
 * timestamps (seconds, UTC). */

#ifndef DATEUTIL_HH
#define DATEUTIL_HH

#include <cmath>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <optional>
#include <set>
#include <string>

#include "traceutil.hh"

/* Index of a UTC calendar day, i.e. floor(ts / 86400). */
using Day_index = int64_t;

static constexpr unsigned SEC_PER_HR = 60 * 60;
static constexpr unsigned SEC_PER_DAY = SEC_PER_HR * 24;
static constexpr unsigned HOURS_PER_DAY = 24;
static constexpr unsigned DAYS_PER_WEEK = 7;

inline Day_index ts2Day_index(const double ts) {
    return floor_to_int64(ts / SEC_PER_DAY, "day index of timestamp");
}

/* Hour of day 0..23 of ts, ignoring which calendar day it falls on.
 * Negative timestamps wrap, so -1 is hour 23 of the previous day. */
inline unsigned hour_of_day(const double ts) {
    const double sec_past_midnight = ts - std::floor(ts / SEC_PER_DAY) * SEC_PER_DAY;
    const auto hour = static_cast<unsigned>(std::floor(sec_past_midnight / SEC_PER_HR));
    // sec_past_midnight can round up to exactly 86400 for tiny negative ts
    return hour < HOURS_PER_DAY ? hour : HOURS_PER_DAY - 1;
}

/* UTC day of week of ts, Monday = 0 ... Sunday = 6. */
inline unsigned day_of_week(const double ts) {
    // day 0 (1970-01-01) was a Thursday
    const Day_index weekday = (ts2Day_index(ts) + 3) % DAYS_PER_WEEK;
    return static_cast<unsigned>(weekday < 0 ? weekday + DAYS_PER_WEEK : weekday);
}

inline const char * weekday_name(const unsigned weekday) {
    static constexpr const char * names[DAYS_PER_WEEK] = { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" };
    return weekday < DAYS_PER_WEEK ? names[weekday] : "?";
}

/* e.g. 19723 => 2024-01-01 */
inline std::string day2str(const Day_index day) {
    struct tm ts_fields{};
    char day_str[80];
    const time_t ts_raw = day * SEC_PER_DAY;
    // gmtime_r assumes argument is GMT
    if (gmtime_r(&ts_raw, &ts_fields) == nullptr) {
        return std::to_string(day);
    }
    strftime(day_str, sizeof(day_str), "%Y-%m-%d", &ts_fields);
    return day_str;
}

/* One "first : last" line per run of consecutive days. */
inline void print_intervals(const std::set<Day_index> & days, std::ostream & out = std::cerr) {
    std::optional<Day_index> interval_start;
    std::optional<Day_index> prev_day;

    for (const auto day : days) {  // set is ordered
        if (prev_day.has_value() and day != prev_day.value() + 1) {
            out << day2str(interval_start.value()) << " : " << day2str(prev_day.value()) << "\n";
            interval_start.reset();
        }
        if (not interval_start.has_value()) {
            interval_start.emplace(day);
        }
        prev_day.emplace(day);
    }
    // print last interval
    if (prev_day.has_value()) {
        out << day2str(interval_start.value()) << " : " << day2str(prev_day.value()) << "\n";
    }
}

#endif
