#ifndef NORMALIZE_HH
#define NORMALIZE_HH

#include <cstddef>
#include <optional>
#include <vector>

#include "trace.hh"

/* Validation counters for the trace as it crossed the boundary. */
struct NormalizationReport {
    size_t records_in{0};
    size_t records_out{0};
    size_t dropped_timestamps{0};   // missing, unparsable, non-finite or out of range
    size_t out_of_range_timestamps{0};
    double ts_min{0};
    double ts_max{0};
    double span_days{0};
    size_t duplicate_timestamps{0}; // records sharing their timestamp with another
    bool input_was_sorted{true};
};

/* The immutable, time-ordered event table every stage reads. */
struct NormalizedTrace {
    std::vector<Event> events{};

    /* Aligned with events when the input carried explicit session ids
     * (missing ones mapped to MISSING_SESSION_ID); empty otherwise. */
    std::vector<int64_t> explicit_session_ids{};

    NormalizationReport report{};

    bool has_explicit_session_ids() const { return not explicit_session_ids.empty(); }
};

/* Timestamps at or beyond this magnitude lose whole-second resolution. */
static constexpr double MAX_ABS_TIMESTAMP = 0x1p53;

/* Drop records without a usable timestamp, then stable-sort ascending
 * (ties keep arrival order). Throws empty_input_error if nothing survives. */
NormalizedTrace normalize_trace(const std::vector<RawRecord> & records);

#endif
