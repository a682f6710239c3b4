#ifndef SESSIONS_HH
#define SESSIONS_HH

#include <cstdint>
#include <optional>
#include <vector>

#include "normalize.hh"
#include "trace.hh"

static constexpr double DEFAULT_GAP_THRESHOLD_SEC = 1800;

/* Accumulator threaded through segmentation, left to right. */
struct SegmentState {
    std::optional<double> previous_timestamp{};    // empty before the first event
    int64_t current_session_id{-1};
    bool current_is_marker{false};                 // current session is a singleton marker
};

struct SegmentStep {
    int64_t session_id;
    SegmentState state;
};

/* Assign one event a session id given the state left by its predecessor.
 * A new session starts on the first event, after a gap strictly greater
 * than gap_threshold_sec, after a marker, and at every marker (which is
 * isolated into its own singleton session). */
SegmentStep segment_step(const SegmentState & state, const Event & event, const double gap_threshold_sec);

/* Fold segment_step over events. Ids start at initial.current_session_id + 1
 * and never decrease. Throws invalid_parameter_error for a non-positive
 * threshold and empty_input_error for an empty sequence. */
std::vector<int64_t> assign_session_ids(const std::vector<Event> & events,
                                        const double gap_threshold_sec,
                                        const SegmentState & initial = {});

/* Collapse per-event ids into one Session per distinct id, ordered by id. */
session_table build_session_table(const std::vector<Event> & events,
                                  const std::vector<int64_t> & session_ids);

/* Session table for a trace: explicit ids when the trace carries them,
 * otherwise inferred with the given gap threshold. */
session_table sessionize(const NormalizedTrace & trace, const double gap_threshold_sec);

#endif
