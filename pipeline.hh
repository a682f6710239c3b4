#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <optional>
#include <vector>

#include "arrivals.hh"
#include "concurrency.hh"
#include "config.hh"
#include "hourofday.hh"
#include "normalize.hh"
#include "sensitivity.hh"
#include "variance.hh"
#include "windows.hh"

/* Every table one run produces, built stage by stage and never modified
 * after run_analysis returns. */
struct AnalysisResult {
    NormalizationReport normalization{};
    bool explicit_session_ids{};

    session_table sessions{};
    SessionDepth depth{};
    ArrivalProcess arrivals{};

    /* sessions binned by start time */
    std::vector<SessionWindow> windows{};
    std::vector<SessionWindow> retained_windows{};

    std::vector<HourOfDayRecord> hour_of_day_windows{};
    std::vector<HourOfDayRecord> hour_of_day_sessions{};

    /* mean turn count per window, and sessions started per window */
    VarianceDecomposition depth_variance{};
    VarianceDecomposition load_variance{};

    std::vector<DailyCurve> daily_curves{};
    std::optional<CurveCorrelation> daily_curve_correlation{};

    std::vector<ConcurrencySummary> concurrency{};
    std::vector<SensitivityRow> sensitivity{};
};

/* Validates config, then runs every stage in order. Parameter and
 * structural errors abort the run, except inside the sensitivity table. */
AnalysisResult run_analysis(const NormalizedTrace & trace, const AnalysisConfig & config);

#endif
