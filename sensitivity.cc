#include "sensitivity.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <sstream>

#include "sessions.hh"
#include "statsutil.hh"
#include "traceutil.hh"

using namespace std;

double fraction_at_least(const session_table & sessions, const unsigned k) {
    if (sessions.empty()) {
        return 0;
    }
    const auto at_least = count_if(sessions.begin(), sessions.end(),
                                   [k](const Session & s) { return s.turn_count >= k; });
    return double(at_least) / sessions.size();
}

vector<Window> filter_sparse_windows(const vector<Window> & windows, const size_t min_count) {
    vector<Window> ret;
    copy_if(windows.begin(), windows.end(), back_inserter(ret),
            [min_count](const Window & w) { return w.count >= min_count; });
    return ret;
}

vector<SessionWindow> filter_sparse_windows(const vector<SessionWindow> & windows, const size_t min_count) {
    vector<SessionWindow> ret;
    copy_if(windows.begin(), windows.end(), back_inserter(ret),
            [min_count](const SessionWindow & w) { return w.window.count >= min_count; });
    return ret;
}

string gap_label(const double gap_threshold_sec) {
    ostringstream label;
    if (gap_threshold_sec > 0 and fmod(gap_threshold_sec, 60) == 0) {
        label << static_cast<int64_t>(gap_threshold_sec / 60) << "m";
    } else {
        label << gap_threshold_sec << "s";
    }
    return label.str();
}

SensitivityResult run_gap_setting(const vector<Event> & events,
                                  const double gap_threshold_sec,
                                  const SensitivityParams & params) {
    const session_table sessions = build_session_table(events, assign_session_ids(events, gap_threshold_sec));

    SensitivityResult ret;
    ret.sessions = sessions.size();
    for (const unsigned k : params.turn_count_thresholds) {
        ret.fraction_at_least.emplace_back(k, fraction_at_least(sessions, k));
    }

    vector<double> turn_counts;
    turn_counts.reserve(sessions.size());
    for (const Session & session : sessions) {
        turn_counts.push_back(session.turn_count);
    }
    ret.mean_turn_count = sample_mean(turn_counts);

    ret.windows = aggregate_session_windows(sessions, params.bin_width_sec,
                                            params.turn_count_thresholds, params.quantiles);
    ret.by_hour = aggregate_hour_of_day(sessions);
    ret.hourly_mean_turn_count_stddev = stddev_of_hourly_means(ret.by_hour);

    ret.retained_windows = filter_sparse_windows(ret.windows, params.min_sessions_per_bin);
    vector<double> retained_means;
    for (const auto & w : ret.retained_windows) {
        retained_means.push_back(w.window.mean);
    }
    ret.retained_window_cv = coefficient_of_variation(retained_means);

    return ret;
}

vector<SensitivityRow> run_gap_sensitivity(const vector<Event> & events, const SensitivityParams & params) {
    if (params.gaps_sec.empty()) {
        throw invalid_parameter_error("no gap thresholds given");
    }
    if (params.turn_count_thresholds.empty()) {
        throw invalid_parameter_error("no turn-count thresholds given");
    }

    vector<SensitivityRow> ret;
    for (const double gap : params.gaps_sec) {
        SensitivityRow row;
        row.label = gap_label(gap);
        row.gap_threshold_sec = gap;

        try {
            row.result.emplace(run_gap_setting(events, gap, params));
            const SensitivityResult & result = row.result.value();
            cerr << "gap=" << row.label << ": sessions=" << result.sessions
                 << ", windows=" << result.windows.size()
                 << " (" << result.retained_windows.size() << " with >= "
                 << params.min_sessions_per_bin << " sessions)\n";
        } catch (const trace_error & e) {
            row.error = e.what();
            cerr << "gap=" << row.label << " failed: " << e.what() << "\n";
        }

        ret.push_back(move(row));
    }

    return ret;
}
