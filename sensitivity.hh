#ifndef SENSITIVITY_HH
#define SENSITIVITY_HH

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "hourofday.hh"
#include "trace.hh"
#include "windows.hh"

inline const std::vector<double> DEFAULT_SENSITIVITY_GAPS = { 900, 1800, 3600 };
inline const std::vector<unsigned> DEFAULT_TURN_COUNT_THRESHOLDS = { 2, 3 };
static constexpr size_t DEFAULT_MIN_SESSIONS_PER_BIN = 100;

struct SensitivityParams {
    std::vector<double> gaps_sec = DEFAULT_SENSITIVITY_GAPS;
    double bin_width_sec = DEFAULT_BIN_WIDTH_SEC;
    std::vector<unsigned> turn_count_thresholds = DEFAULT_TURN_COUNT_THRESHOLDS;
    size_t min_sessions_per_bin = DEFAULT_MIN_SESSIONS_PER_BIN;
    std::vector<double> quantiles = DEFAULT_WINDOW_QUANTILES;
};

/* Outcome of Segmenter -> WindowAggregator -> HourOfDayAggregator for one gap. */
struct SensitivityResult {
    size_t sessions{};
    std::vector<std::pair<unsigned, double>> fraction_at_least{};
    double mean_turn_count{};

    /* std (ddof=1) of mean turn count across hours of day */
    std::optional<double> hourly_mean_turn_count_stddev{};

    std::vector<HourOfDayRecord> by_hour{};
    std::vector<SessionWindow> windows{};

    /* windows with at least min_sessions_per_bin sessions, and the CV of
     * their mean turn count */
    std::vector<SessionWindow> retained_windows{};
    std::optional<double> retained_window_cv{};
};

/* One row per requested gap, in request order. Exactly one of result and
 * error is set. */
struct SensitivityRow {
    std::string label{};
    double gap_threshold_sec{};
    std::optional<SensitivityResult> result{};
    std::string error{};
};

/* Fraction of sessions with turn_count >= k; 0 for an empty table. */
double fraction_at_least(const session_table & sessions, const unsigned k);

/* Keep rows with count >= min_count, preserving order. */
std::vector<Window> filter_sparse_windows(const std::vector<Window> & windows, const size_t min_count);
std::vector<SessionWindow> filter_sparse_windows(const std::vector<SessionWindow> & windows, const size_t min_count);

/* "15m" for 900, "90s" for 90 */
std::string gap_label(const double gap_threshold_sec);

/* Run the pipeline for one gap; errors propagate. Explicit session ids in
 * the trace are ignored, since the point is to vary the inference. */
SensitivityResult run_gap_setting(const std::vector<Event> & events,
                                  const double gap_threshold_sec,
                                  const SensitivityParams & params);

/* Run every gap in params.gaps_sec. A trace_error in one setting is
 * recorded in that row and does not stop the others. Throws
 * invalid_parameter_error up front for empty gap or threshold lists. */
std::vector<SensitivityRow> run_gap_sensitivity(const std::vector<Event> & events,
                                                const SensitivityParams & params);

#endif
