#ifndef ARRIVALS_HH
#define ARRIVALS_HH

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "dateutil.hh"
#include "trace.hh"

/* Strictly positive gaps between consecutive events; equal timestamps
 * contribute nothing. */
struct InterArrivalStats {
    size_t gaps{};
    double mean{};
    double median{};
    double p95{};
    double min{};
    double max{};
};

/* Mean and std (ddof=1) of arrival counts over the observed bins of one width. */
struct ArrivalRate {
    double bin_width_sec{};
    size_t bins{};
    double mean{};
    std::optional<double> stddev{};
};

struct ArrivalProcess {
    size_t events{};
    std::optional<InterArrivalStats> inter_arrival{};
    std::vector<ArrivalRate> rates{};
    std::array<uint64_t, HOURS_PER_DAY> by_hour{};

    /* std (ddof=1) across the hours that have arrivals */
    std::optional<double> by_hour_stddev{};

    /* Monday first; std (ddof=1) across the weekdays that have arrivals */
    std::array<uint64_t, DAYS_PER_WEEK> by_day_of_week{};
    std::optional<double> by_day_of_week_stddev{};
};

static constexpr double ARRIVAL_MINUTE_BIN_SEC = 60;

std::optional<InterArrivalStats> inter_arrival_stats(const std::vector<Event> & events);

/* Throws invalid_parameter_error for a non-positive width. */
ArrivalRate arrival_rate(const std::vector<Event> & events, const double bin_width_sec);

/* Inter-arrival gaps, arrival rates per minute and per bin_width_sec,
 * and arrivals by hour of day and by day of week. Throws empty_input_error without events. */
ArrivalProcess describe_arrivals(const std::vector<Event> & events, const double bin_width_sec);

/* Distribution of turns per session. */
struct SessionDepth {
    size_t sessions{};
    double mean{};
    double median{};
    double p90{};
    double p95{};
    double p99{};
    std::vector<std::pair<unsigned, double>> fraction_at_least{};
};

/* Throws empty_input_error for an empty table. */
SessionDepth describe_session_depth(const session_table & sessions,
                                    const std::vector<unsigned> & turn_count_thresholds);

#endif
