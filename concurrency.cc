#include "concurrency.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include "statsutil.hh"
#include "traceutil.hh"

using namespace std;

namespace {

/* Level-weighted median of (level, duration) plateaus; total is the sum of durations. */
double weighted_median(vector<pair<int64_t, double>> plateaus, const double total) {
    sort(plateaus.begin(), plateaus.end());

    double cumulative = 0;
    for (size_t i = 0; i < plateaus.size(); i++) {
        cumulative += plateaus[i].second;
        if (cumulative > total / 2) {
            return plateaus[i].first;
        }
        if (cumulative == total / 2) {
            // exactly half the time at or below this level
            const int64_t next = i + 1 < plateaus.size() ? plateaus[i + 1].first : plateaus[i].first;
            return (plateaus[i].first + next) / 2.0;
        }
    }
    return plateaus.back().first;
}

}

string duration_model_label(const double seconds_per_turn) {
    ostringstream label;
    if (seconds_per_turn == floor(seconds_per_turn)) {
        label << static_cast<int64_t>(seconds_per_turn) << "s";
    } else {
        label << seconds_per_turn << "s";
    }
    return label.str();
}

vector<ConcurrencyEvent> build_concurrency_events(const session_table & sessions, const double seconds_per_turn) {
    throw_if_not_positive(seconds_per_turn, "seconds per turn");

    vector<ConcurrencyEvent> ret;
    ret.reserve(2 * sessions.size());
    for (const Session & session : sessions) {
        const double duration = session.turn_count * seconds_per_turn;
        ret.push_back({session.end_time - duration, +1});
        ret.push_back({session.end_time, -1});
    }

    sort(ret.begin(), ret.end(), [](const ConcurrencyEvent & a, const ConcurrencyEvent & b) {
        if (a.time != b.time) {
            return a.time < b.time;
        }
        return a.delta > b.delta;
    });

    return ret;
}

vector<int64_t> concurrency_levels(const vector<ConcurrencyEvent> & events) {
    vector<int64_t> ret;
    ret.reserve(events.size());

    int64_t current = 0;
    for (const auto & event : events) {
        current += event.delta;
        ret.push_back(current);
    }
    return ret;
}

ConcurrencySummary estimate_concurrency(const session_table & sessions, const double seconds_per_turn) {
    throw_if_not_positive(seconds_per_turn, "seconds per turn");
    if (sessions.empty()) {
        throw empty_input_error("no sessions for concurrency estimation");
    }

    const vector<ConcurrencyEvent> events = build_concurrency_events(sessions, seconds_per_turn);
    const vector<int64_t> levels = concurrency_levels(events);

    ConcurrencySummary ret;
    ret.label = duration_model_label(seconds_per_turn);
    ret.seconds_per_turn = seconds_per_turn;
    ret.sessions = sessions.size();
    ret.peak = *max_element(levels.begin(), levels.end());

    vector<double> event_levels(levels.begin(), levels.end());
    ret.event_mean = sample_mean(event_levels);
    ret.event_median = median(move(event_levels));

    /* level after event i holds until event i+1 */
    vector<pair<int64_t, double>> plateaus;
    double weighted_sum = 0;
    for (size_t i = 0; i + 1 < events.size(); i++) {
        const double held = events[i + 1].time - events[i].time;
        if (held > 0) {
            plateaus.emplace_back(levels[i], held);
            weighted_sum += levels[i] * held;
        }
    }
    const double total = events.back().time - events.front().time;

    if (plateaus.empty() or not (total > 0)) {
        /* every interval collapsed to one instant at this timestamp precision */
        ret.mean = ret.event_mean;
        ret.median = ret.event_median;
    } else {
        ret.mean = weighted_sum / total;
        ret.median = weighted_median(move(plateaus), total);
    }

    return ret;
}

vector<ConcurrencySummary> estimate_concurrency(const session_table & sessions, const vector<double> & seconds_per_turn) {
    if (seconds_per_turn.empty()) {
        throw invalid_parameter_error("no duration-model multipliers given");
    }

    vector<ConcurrencySummary> ret;
    for (const double k : seconds_per_turn) {
        ret.push_back(estimate_concurrency(sessions, k));
        cerr << "concurrency " << ret.back().label << "/turn: peak=" << ret.back().peak
             << ", mean=" << ret.back().mean << "\n";
    }
    return ret;
}
