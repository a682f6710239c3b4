#ifndef HOUROFDAY_HH
#define HOUROFDAY_HH

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "dateutil.hh"
#include "trace.hh"
#include "windows.hh"

/* Statistics over every sample whose timestamp falls in one hour of the
 * day, across all calendar days. */
struct HourOfDayRecord {
    unsigned hour{};
    double mean{};
    std::optional<double> stddev{};     // ddof=1; empty for a single sample
    double p10{};
    double p90{};
    size_t sample_count{};
};

/* Group samples by hour_of_day(timestamp). Hours without samples are
 * not emitted; rows are in hour order. */
std::vector<HourOfDayRecord> aggregate_hour_of_day(const std::vector<Sample> & samples);

/* Windows keyed by the hour of their bin start, value = window mean. */
std::vector<HourOfDayRecord> aggregate_hour_of_day(const std::vector<Window> & windows);

/* Sessions keyed by the hour of their start time, value = turn count. */
std::vector<HourOfDayRecord> aggregate_hour_of_day(const session_table & sessions);

/* Standard deviation (ddof=1) of the per-hour means. */
std::optional<double> stddev_of_hourly_means(const std::vector<HourOfDayRecord> & records);

/* One calendar day's metric at each hour of day; absent where the day had
 * no samples in that hour. */
struct DailyCurve {
    Day_index day{};
    std::array<std::optional<double>, HOURS_PER_DAY> values{};
};

/* Mean sample value per (UTC day, hour), one curve per observed day in day order. */
std::vector<DailyCurve> build_daily_curves(const std::vector<Sample> & samples);

struct CurveCorrelation {
    double mean{};
    double stddev{};    // population std over pairs
    size_t pairs{};
};

static constexpr size_t DEFAULT_MIN_CURVE_OVERLAP = 6;

/* Pearson correlation of every pair of daily curves over the hours both
 * have, skipping pairs with fewer than min_overlap shared hours or an
 * undefined correlation. Empty when no pair qualifies. */
std::optional<CurveCorrelation> daily_curve_correlation(const std::vector<DailyCurve> & curves,
                                                        const size_t min_overlap = DEFAULT_MIN_CURVE_OVERLAP);

#endif
