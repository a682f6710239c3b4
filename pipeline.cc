#include "pipeline.hh"

#include <iostream>

#include "sessions.hh"
#include "traceutil.hh"

using namespace std;

AnalysisResult run_analysis(const NormalizedTrace & trace, const AnalysisConfig & config) {
    config.validate();

    AnalysisResult ret;
    ret.normalization = trace.report;
    ret.explicit_session_ids = trace.has_explicit_session_ids();

    ret.sessions = sessionize(trace, config.gap_threshold_sec);
    cerr << "sessions: " << ret.sessions.size()
         << (ret.explicit_session_ids ? " (explicit ids)" : " (inferred)")
         << ", RSS=" << memcheck() / 1024 << " MiB\n";

    ret.depth = describe_session_depth(ret.sessions, config.turn_count_thresholds);
    ret.arrivals = describe_arrivals(trace.events, config.bin_width_sec);

    ret.windows = aggregate_session_windows(ret.sessions, config.bin_width_sec,
                                            config.turn_count_thresholds, config.quantiles);
    ret.retained_windows = filter_sparse_windows(ret.windows, config.min_session_count_per_bin);
    cerr << "windows: " << ret.windows.size() << ", "
         << ret.retained_windows.size() << " with >= " << config.min_session_count_per_bin << " sessions\n";

    const vector<Window> windows = windows_of(ret.windows);
    ret.hour_of_day_windows = aggregate_hour_of_day(windows);
    ret.hour_of_day_sessions = aggregate_hour_of_day(ret.sessions);

    ret.depth_variance = decompose_variance(windows, WindowMetric::mean, config.min_windows_per_day);
    ret.load_variance = decompose_variance(windows, WindowMetric::count, config.min_windows_per_day);

    ret.daily_curves = build_daily_curves(session_turn_samples(ret.sessions));
    ret.daily_curve_correlation = daily_curve_correlation(ret.daily_curves,
                                                          config.min_days_overlap_for_correlation);

    ret.concurrency = estimate_concurrency(ret.sessions, config.duration_model_multipliers);
    ret.sensitivity = run_gap_sensitivity(trace.events, config.sensitivity_params());

    return ret;
}
