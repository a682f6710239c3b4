#ifndef CONCURRENCY_HH
#define CONCURRENCY_HH

#include <cstdint>
#include <string>
#include <vector>

#include "trace.hh"

inline const std::vector<double> DEFAULT_DURATION_MULTIPLIERS = { 10, 30 };

/* +1 at an interval's start, -1 just after its end. */
struct ConcurrencyEvent {
    double time;
    int delta;
};

/* Concurrency summary for one duration model, duration = turn_count * K. */
struct ConcurrencySummary {
    std::string label{};            // e.g. "10s"
    double seconds_per_turn{};
    size_t sessions{};
    int64_t peak{};

    /* Over the step function between the first and last sweep event, each
     * level weighted by how long it holds. */
    double mean{};
    double median{};

    /* Equal weight per sweep event. Under-represents long plateaus; kept
     * for comparison with event-indexed reference numbers only. */
    double event_mean{};
    double event_median{};
};

/* Two events per session for the interval [end - turns * K, end],
 * sorted in sweep order: by time, and at equal times every +1 before any
 * -1. The -1 is conceptually at end + epsilon, so intervals touching at a
 * single instant both count as active there. */
std::vector<ConcurrencyEvent> build_concurrency_events(const session_table & sessions,
                                                       const double seconds_per_turn);

/* Running prefix sum over sweep-ordered events: level after each event. */
std::vector<int64_t> concurrency_levels(const std::vector<ConcurrencyEvent> & events);

/* Throws invalid_parameter_error for a non-positive multiplier and
 * empty_input_error for an empty session table. */
ConcurrencySummary estimate_concurrency(const session_table & sessions, const double seconds_per_turn);

/* One summary per multiplier, in the given order. */
std::vector<ConcurrencySummary> estimate_concurrency(const session_table & sessions,
                                                     const std::vector<double> & seconds_per_turn);

/* "10s", "2.5s" */
std::string duration_model_label(const double seconds_per_turn);

#endif
