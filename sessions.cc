#include "sessions.hh"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <google/dense_hash_map>

#include "traceutil.hh"

using namespace std;
using google::dense_hash_map;

SegmentStep segment_step(const SegmentState & state, const Event & event, const double gap_threshold_sec) {
    SegmentState next = state;

    if (not event.kind.segmentable()) {
        next.current_session_id++;
        next.current_is_marker = true;
        next.previous_timestamp.emplace(event.timestamp);
        return { next.current_session_id, next };
    }

    const bool starts_session = not state.previous_timestamp.has_value()
        or state.current_is_marker
        or event.timestamp - state.previous_timestamp.value() > gap_threshold_sec;

    if (starts_session) {
        next.current_session_id++;
    }
    next.current_is_marker = false;
    next.previous_timestamp.emplace(event.timestamp);

    return { next.current_session_id, next };
}

vector<int64_t> assign_session_ids(const vector<Event> & events,
                                   const double gap_threshold_sec,
                                   const SegmentState & initial) {
    throw_if_not_positive(gap_threshold_sec, "gap threshold");
    if (events.empty()) {
        throw empty_input_error("no events to segment");
    }

    vector<int64_t> ret;
    ret.reserve(events.size());

    SegmentState state = initial;
    for (const Event & event : events) {
        const auto [session_id, next] = segment_step(state, event, gap_threshold_sec);
        ret.push_back(session_id);
        state = next;
    }

    return ret;
}

session_table build_session_table(const vector<Event> & events, const vector<int64_t> & session_ids) {
    if (events.size() != session_ids.size()) {
        throw logic_error("build_session_table: " + to_string(events.size()) + " events but "
                          + to_string(session_ids.size()) + " session ids");
    }

    // index[session id] = position in ret
    dense_hash_map<int64_t, size_t> index;
    index.set_empty_key(numeric_limits<int64_t>::min());

    session_table ret;
    for (size_t i = 0; i < events.size(); i++) {
        if (session_ids[i] == numeric_limits<int64_t>::min()) {
            throw invalid_parameter_error("session id " + to_string(session_ids[i]) + " is reserved");
        }
        const double ts = events[i].timestamp;
        const auto it = index.find(session_ids[i]);
        if (it == index.end()) {
            index[session_ids[i]] = ret.size();
            ret.push_back({session_ids[i], ts, ts, 1, 0});
        } else {
            Session & session = ret[it->second];
            session.start_time = min(session.start_time, ts);
            session.end_time = max(session.end_time, ts);
            session.turn_count++;
        }
    }

    for (Session & session : ret) {
        session.duration_sec = max(0.0, session.end_time - session.start_time);
    }

    /* segmenter ids arrive in order already; explicit ids may not */
    if (not is_sorted(ret.begin(), ret.end(), [](const Session & a, const Session & b) { return a.id < b.id; })) {
        sort(ret.begin(), ret.end(), [](const Session & a, const Session & b) { return a.id < b.id; });
    }

    return ret;
}

session_table sessionize(const NormalizedTrace & trace, const double gap_threshold_sec) {
    if (trace.has_explicit_session_ids()) {
        return build_session_table(trace.events, trace.explicit_session_ids);
    }
    return build_session_table(trace.events, assign_session_ids(trace.events, gap_threshold_sec));
}
