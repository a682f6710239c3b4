#ifndef WINDOWS_HH
#define WINDOWS_HH

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "trace.hh"

static constexpr double DEFAULT_BIN_WIDTH_SEC = 3600;
inline const std::vector<double> DEFAULT_WINDOW_QUANTILES = { 0.90, 0.95 };

/* One (timestamp, value) observation to be binned. */
struct Sample {
    double timestamp;
    double value;
};

/* Summary of one observed fixed-width bin [bin_start, bin_end). */
struct Window {
    double bin_start{};
    double bin_end{};
    size_t count{};
    double mean{};

    /* (level, value) in the order the levels were requested */
    std::vector<std::pair<double, double>> quantiles{};

    /* Throws out_of_range if level was not requested. */
    double quantile(const double level) const;
};

/* Window plus, for each turn-count threshold k, the fraction of the
 * window's sessions with turn_count >= k. */
struct SessionWindow {
    Window window{};
    std::vector<std::pair<unsigned, double>> fraction_at_least{};
};

/* floor(ts / w) * w */
double bin_start(const double ts, const double bin_width_sec);

/* Group samples by bin_start and emit one Window per observed bin in
 * bin_start order; empty bins are never emitted. Quantiles interpolate
 * linearly between order statistics. */
std::vector<Window> aggregate_windows(const std::vector<Sample> & samples,
                                      const double bin_width_sec,
                                      const std::vector<double> & quantile_levels = DEFAULT_WINDOW_QUANTILES);

/* Sessions binned by start time, value = turn count. */
std::vector<SessionWindow> aggregate_session_windows(const session_table & sessions,
                                                     const double bin_width_sec,
                                                     const std::vector<unsigned> & turn_count_thresholds,
                                                     const std::vector<double> & quantile_levels = DEFAULT_WINDOW_QUANTILES);

std::vector<Window> windows_of(const std::vector<SessionWindow> & session_windows);

/* (start_time, turn_count) per session */
std::vector<Sample> session_turn_samples(const session_table & sessions);

/* (timestamp, 1) per event; window counts are then arrival counts */
std::vector<Sample> event_arrival_samples(const std::vector<Event> & events);

/* (bin_start, mean) per window */
std::vector<Sample> window_mean_samples(const std::vector<Window> & windows);

#endif
