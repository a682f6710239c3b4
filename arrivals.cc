#include "arrivals.hh"

#include <algorithm>

#include "sensitivity.hh"
#include "statsutil.hh"
#include "traceutil.hh"
#include "windows.hh"

using namespace std;

optional<InterArrivalStats> inter_arrival_stats(const vector<Event> & events) {
    vector<double> gaps;
    for (size_t i = 1; i < events.size(); i++) {
        const double gap = events[i].timestamp - events[i - 1].timestamp;
        if (gap > 0) {
            gaps.push_back(gap);
        }
    }
    if (gaps.empty()) {
        return {};
    }

    sort(gaps.begin(), gaps.end());

    InterArrivalStats ret;
    ret.gaps = gaps.size();
    ret.mean = sample_mean(gaps);
    ret.median = quantile_sorted(gaps, 0.5);
    ret.p95 = quantile_sorted(gaps, 0.95);
    ret.min = gaps.front();
    ret.max = gaps.back();
    return ret;
}

ArrivalRate arrival_rate(const vector<Event> & events, const double bin_width_sec) {
    const vector<Window> windows = aggregate_windows(event_arrival_samples(events), bin_width_sec, {});

    ArrivalRate ret;
    ret.bin_width_sec = bin_width_sec;
    ret.bins = windows.size();
    if (windows.empty()) {
        return ret;
    }

    vector<double> counts;
    counts.reserve(windows.size());
    for (const Window & w : windows) {
        counts.push_back(w.count);
    }
    ret.mean = sample_mean(counts);
    ret.stddev = sample_stddev(counts);
    return ret;
}

ArrivalProcess describe_arrivals(const vector<Event> & events, const double bin_width_sec) {
    if (events.empty()) {
        throw empty_input_error("no events to describe");
    }

    ArrivalProcess ret;
    ret.events = events.size();
    ret.inter_arrival = inter_arrival_stats(events);

    ret.rates.push_back(arrival_rate(events, ARRIVAL_MINUTE_BIN_SEC));
    if (bin_width_sec != ARRIVAL_MINUTE_BIN_SEC) {
        ret.rates.push_back(arrival_rate(events, bin_width_sec));
    }

    for (const Event & event : events) {
        ret.by_hour.at(hour_of_day(event.timestamp))++;
    }
    vector<double> nonzero_hours;
    for (const uint64_t count : ret.by_hour) {
        if (count > 0) {
            nonzero_hours.push_back(count);
        }
    }
    ret.by_hour_stddev = sample_stddev(nonzero_hours);

    for (const Event & event : events) {
        ret.by_day_of_week.at(day_of_week(event.timestamp))++;
    }
    vector<double> nonzero_weekdays;
    for (const uint64_t count : ret.by_day_of_week) {
        if (count > 0) {
            nonzero_weekdays.push_back(count);
        }
    }
    ret.by_day_of_week_stddev = sample_stddev(nonzero_weekdays);

    return ret;
}

SessionDepth describe_session_depth(const session_table & sessions, const vector<unsigned> & turn_count_thresholds) {
    if (sessions.empty()) {
        throw empty_input_error("no sessions to describe");
    }

    vector<double> turns;
    turns.reserve(sessions.size());
    for (const Session & session : sessions) {
        turns.push_back(session.turn_count);
    }
    sort(turns.begin(), turns.end());

    SessionDepth ret;
    ret.sessions = sessions.size();
    ret.mean = sample_mean(turns);
    ret.median = quantile_sorted(turns, 0.5);
    ret.p90 = quantile_sorted(turns, 0.90);
    ret.p95 = quantile_sorted(turns, 0.95);
    ret.p99 = quantile_sorted(turns, 0.99);
    for (const unsigned k : turn_count_thresholds) {
        ret.fraction_at_least.emplace_back(k, fraction_at_least(sessions, k));
    }
    return ret;
}
