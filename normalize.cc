#include "normalize.hh"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "dateutil.hh"
#include "traceutil.hh"

using namespace std;

NormalizedTrace normalize_trace(const vector<RawRecord> & records) {
    NormalizedTrace ret;
    NormalizationReport & report = ret.report;
    report.records_in = records.size();

    const bool keyed = any_of(records.begin(), records.end(),
                              [](const RawRecord & r) { return r.explicit_session_id.has_value(); });

    /* (event, explicit id) pairs, so both orders stay aligned through the sort */
    vector<pair<Event, int64_t>> kept;
    kept.reserve(records.size());

    for (size_t i = 0; i < records.size(); i++) {
        const RawRecord & record = records[i];
        if (not record.timestamp.has_value() or not isfinite(record.timestamp.value())) {
            report.dropped_timestamps++;
            continue;
        }
        if (not (fabs(record.timestamp.value()) < MAX_ABS_TIMESTAMP)) {
            report.dropped_timestamps++;
            report.out_of_range_timestamps++;
            continue;
        }

        Event event;
        event.timestamp = record.timestamp.value();
        event.arrival_index = i;
        if (record.kind.has_value() and not record.kind.value().empty()) {
            event.kind = EventKind{record.kind.value()};
        }
        kept.emplace_back(event, record.explicit_session_id.value_or(MISSING_SESSION_ID));
    }

    if (report.dropped_timestamps > 0) {
        cerr << "Dropped " << report.dropped_timestamps << " of " << records.size()
             << " records with missing or unparsable timestamps ("
             << report.out_of_range_timestamps << " out of range)\n";
    }

    if (kept.empty()) {
        throw empty_input_error("no records with a usable timestamp (of "
                                + to_string(records.size()) + " read)");
    }

    report.input_was_sorted = is_sorted(kept.begin(), kept.end(),
            [](const auto & a, const auto & b) { return a.first.timestamp < b.first.timestamp; });
    if (not report.input_was_sorted) {
        stable_sort(kept.begin(), kept.end(),
                [](const auto & a, const auto & b) { return a.first.timestamp < b.first.timestamp; });
    }

    ret.events.reserve(kept.size());
    if (keyed) {
        ret.explicit_session_ids.reserve(kept.size());
    }
    for (const auto & [event, session_id] : kept) {
        ret.events.push_back(event);
        if (keyed) {
            ret.explicit_session_ids.push_back(session_id);
        }
    }

    report.records_out = ret.events.size();
    report.ts_min = ret.events.front().timestamp;
    report.ts_max = ret.events.back().timestamp;
    report.span_days = (report.ts_max - report.ts_min) / SEC_PER_DAY;

    /* sorted, so equal timestamps are adjacent */
    size_t run_length = 1;
    for (size_t i = 1; i <= ret.events.size(); i++) {
        if (i < ret.events.size() and ret.events[i].timestamp == ret.events[i - 1].timestamp) {
            run_length++;
            continue;
        }
        if (run_length > 1) {
            report.duplicate_timestamps += run_length;
        }
        run_length = 1;
    }

    return ret;
}
