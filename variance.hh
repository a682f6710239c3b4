#ifndef VARIANCE_HH
#define VARIANCE_HH

#include <cstddef>
#include <optional>
#include <vector>

#include "windows.hh"

static constexpr size_t DEFAULT_MIN_WINDOWS_PER_DAY = 6;

struct IntraDayCV {
    double mean{};                      // mean over qualifying days of the per-day CV
    std::optional<double> stddev{};     // ddof=1; empty with a single qualifying day
    size_t days{};
};

struct InterDayCV {
    double mean{};                      // mean over qualifying hours of the per-hour CV
    size_t hours{};
};

/* CV = std / mean (ddof=1) at three granularities. A level whose guard is
 * never met is empty, never zero. */
struct VarianceDecomposition {
    std::optional<double> global_cv{};
    std::optional<IntraDayCV> intra_day{};
    std::optional<InterDayCV> inter_day{};

    size_t windows{};
    size_t days_observed{};

    /* Throw insufficient_data_error when the level is absent. */
    double global_cv_or_throw() const;
    const IntraDayCV & intra_day_or_throw() const;
    const InterDayCV & inter_day_or_throw() const;
};

enum class WindowMetric { mean, count };

/* series: one (bin_start, value) row per window.
 * Intra-day: per UTC day whose windows cover at least min_windows_per_day
 *   distinct hours of day and have a positive mean, the CV across that
 *   day's windows.
 * Inter-day: windows are first averaged per (day, hour); then per hour of
 *   day seen on at least two days with a positive mean, the CV across days.
 * Throws empty_input_error for an empty series. */
VarianceDecomposition decompose_variance(const std::vector<Sample> & series,
                                         const size_t min_windows_per_day = DEFAULT_MIN_WINDOWS_PER_DAY);

VarianceDecomposition decompose_variance(const std::vector<Window> & windows,
                                         const WindowMetric metric = WindowMetric::mean,
                                         const size_t min_windows_per_day = DEFAULT_MIN_WINDOWS_PER_DAY);

#endif
