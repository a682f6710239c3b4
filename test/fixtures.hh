#ifndef FIXTURES_HH
#define FIXTURES_HH

#include <cstdint>
#include <vector>

#include "trace.hh"

/* Conversational events at the given timestamps, arrival order as given. */
inline std::vector<Event> conversation_events(const std::vector<double> & timestamps) {
    std::vector<Event> ret;
    for (size_t i = 0; i < timestamps.size(); i++) {
        ret.push_back({timestamps[i], EventKind{}, i});
    }
    return ret;
}

inline Session make_session(const int64_t id, const double start, const double end, const uint32_t turns) {
    return {id, start, end, turns, end - start};
}

#endif
