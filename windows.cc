#include "windows.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <google/dense_hash_map>

#include "statsutil.hh"
#include "traceutil.hh"

using namespace std;
using google::dense_hash_map;

namespace {

using bin_key = int64_t;

bin_key to_bin_key(const double ts, const double bin_width_sec) {
    return floor_to_int64(ts / bin_width_sec, "window index of timestamp");
}

void check_quantile_levels(const vector<double> & quantile_levels) {
    for (const double q : quantile_levels) {
        if (not (q >= 0 and q <= 1)) {
            throw invalid_parameter_error("quantile level must lie in [0, 1], got " + to_string(q));
        }
    }
}

/* Indices of samples grouped by bin, in ascending bin order. */
vector<pair<bin_key, vector<size_t>>> group_by_bin(const vector<Sample> & samples, const double bin_width_sec) {
    // index[bin] = position in groups
    dense_hash_map<bin_key, size_t> index;
    index.set_empty_key(numeric_limits<bin_key>::min());

    vector<pair<bin_key, vector<size_t>>> groups;
    for (size_t i = 0; i < samples.size(); i++) {
        const bin_key key = to_bin_key(samples[i].timestamp, bin_width_sec);
        const auto it = index.find(key);
        if (it == index.end()) {
            index[key] = groups.size();
            groups.push_back({key, {i}});
        } else {
            groups[it->second].second.push_back(i);
        }
    }

    sort(groups.begin(), groups.end(), [](const auto & a, const auto & b) { return a.first < b.first; });
    return groups;
}

Window summarize_bin(const bin_key key, const double bin_width_sec, vector<double> values,
                     const vector<double> & quantile_levels) {
    Window ret;
    ret.bin_start = key * bin_width_sec;
    ret.bin_end = ret.bin_start + bin_width_sec;
    ret.count = values.size();
    ret.mean = sample_mean(values);

    sort(values.begin(), values.end());
    for (const double q : quantile_levels) {
        ret.quantiles.emplace_back(q, quantile_sorted(values, q));
    }
    return ret;
}

}

double Window::quantile(const double level) const {
    for (const auto & [q, value] : quantiles) {
        if (q == level) {
            return value;
        }
    }
    throw out_of_range("quantile " + to_string(level) + " was not computed for this window");
}

double bin_start(const double ts, const double bin_width_sec) {
    return to_bin_key(ts, bin_width_sec) * bin_width_sec;
}

vector<Window> aggregate_windows(const vector<Sample> & samples,
                                 const double bin_width_sec,
                                 const vector<double> & quantile_levels) {
    throw_if_not_positive(bin_width_sec, "bin width");
    check_quantile_levels(quantile_levels);

    vector<Window> ret;
    for (const auto & [key, members] : group_by_bin(samples, bin_width_sec)) {
        vector<double> values;
        values.reserve(members.size());
        for (const size_t i : members) {
            values.push_back(samples[i].value);
        }
        ret.push_back(summarize_bin(key, bin_width_sec, move(values), quantile_levels));
    }

    return ret;
}

vector<SessionWindow> aggregate_session_windows(const session_table & sessions,
                                                const double bin_width_sec,
                                                const vector<unsigned> & turn_count_thresholds,
                                                const vector<double> & quantile_levels) {
    throw_if_not_positive(bin_width_sec, "bin width");
    check_quantile_levels(quantile_levels);

    const vector<Sample> samples = session_turn_samples(sessions);

    vector<SessionWindow> ret;
    for (const auto & [key, members] : group_by_bin(samples, bin_width_sec)) {
        vector<double> values;
        values.reserve(members.size());
        for (const size_t i : members) {
            values.push_back(samples[i].value);
        }

        SessionWindow session_window;
        for (const unsigned k : turn_count_thresholds) {
            const auto at_least = count_if(values.begin(), values.end(), [k](const double turns) { return turns >= k; });
            session_window.fraction_at_least.emplace_back(k, double(at_least) / values.size());
        }
        session_window.window = summarize_bin(key, bin_width_sec, move(values), quantile_levels);
        ret.push_back(move(session_window));
    }

    return ret;
}

vector<Window> windows_of(const vector<SessionWindow> & session_windows) {
    vector<Window> ret;
    ret.reserve(session_windows.size());
    for (const auto & session_window : session_windows) {
        ret.push_back(session_window.window);
    }
    return ret;
}

vector<Sample> session_turn_samples(const session_table & sessions) {
    vector<Sample> ret;
    ret.reserve(sessions.size());
    for (const Session & session : sessions) {
        ret.push_back({session.start_time, double(session.turn_count)});
    }
    return ret;
}

vector<Sample> event_arrival_samples(const vector<Event> & events) {
    vector<Sample> ret;
    ret.reserve(events.size());
    for (const Event & event : events) {
        ret.push_back({event.timestamp, 1.0});
    }
    return ret;
}

vector<Sample> window_mean_samples(const vector<Window> & windows) {
    vector<Sample> ret;
    ret.reserve(windows.size());
    for (const Window & window : windows) {
        ret.push_back({window.bin_start, window.mean});
    }
    return ret;
}
