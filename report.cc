#include "report.hh"

#include <iomanip>
#include <memory>
#include <string>

using namespace std;

namespace {

struct maybe {
    const optional<double> & value;
};

ostream & operator<<(ostream & out, const maybe & m) {
    if (m.value.has_value()) {
        out << m.value.value();
    } else {
        out << "NA";
    }
    return out;
}

Json::Value to_json(const optional<double> & value) {
    return value.has_value() ? Json::Value(value.value()) : Json::Value(Json::nullValue);
}

Json::Value to_json(const vector<pair<unsigned, double>> & fractions) {
    Json::Value ret(Json::objectValue);
    for (const auto & [k, fraction] : fractions) {
        ret["ge" + to_string(k)] = fraction;
    }
    return ret;
}

void print_fractions(const vector<pair<unsigned, double>> & fractions, ostream & out) {
    for (const auto & [k, fraction] : fractions) {
        out << " frac_ge" << k << "=" << fraction;
    }
}

Json::Value variance_json(const VarianceDecomposition & variance) {
    Json::Value ret;
    ret["windows"] = Json::UInt64(variance.windows);
    ret["days_observed"] = Json::UInt64(variance.days_observed);
    ret["global_cv"] = to_json(variance.global_cv);
    if (variance.intra_day.has_value()) {
        ret["intra_day_cv_mean"] = variance.intra_day->mean;
        ret["intra_day_cv_std"] = to_json(variance.intra_day->stddev);
        ret["intra_day_days"] = Json::UInt64(variance.intra_day->days);
    } else {
        ret["intra_day_cv_mean"] = Json::nullValue;
    }
    if (variance.inter_day.has_value()) {
        ret["inter_day_cv_mean"] = variance.inter_day->mean;
        ret["inter_day_hours"] = Json::UInt64(variance.inter_day->hours);
    } else {
        ret["inter_day_cv_mean"] = Json::nullValue;
    }
    return ret;
}

}

void print_normalization(const NormalizationReport & report, ostream & out) {
    out << "#records_in=" << report.records_in << " records_out=" << report.records_out
        << " dropped_timestamps=" << report.dropped_timestamps
        << " out_of_range_timestamps=" << report.out_of_range_timestamps
        << " duplicate_timestamps=" << report.duplicate_timestamps
        << " input_was_sorted=" << (report.input_was_sorted ? "yes" : "no") << "\n";
    out << "#ts_min=" << report.ts_min << " ts_max=" << report.ts_max
        << " span_days=" << report.span_days << "\n";
}

void print_sessions(const session_table & sessions, ostream & out) {
    for (const Session & session : sessions) {
        out << "session " << session << "\n";
    }
}

void print_session_depth(const SessionDepth & depth, ostream & out) {
    out << "#sessions=" << depth.sessions << " turns_mean=" << depth.mean
        << " turns_median=" << depth.median << " turns_p90=" << depth.p90
        << " turns_p95=" << depth.p95 << " turns_p99=" << depth.p99;
    print_fractions(depth.fraction_at_least, out);
    out << "\n";
}

void print_arrivals(const ArrivalProcess & arrivals, ostream & out) {
    out << "#events=" << arrivals.events;
    if (arrivals.inter_arrival.has_value()) {
        const InterArrivalStats & gaps = arrivals.inter_arrival.value();
        out << " positive_gaps=" << gaps.gaps << " gap_mean=" << gaps.mean
            << " gap_median=" << gaps.median << " gap_p95=" << gaps.p95
            << " gap_min=" << gaps.min << " gap_max=" << gaps.max;
    } else {
        out << " positive_gaps=0";
    }
    out << "\n";

    for (const ArrivalRate & rate : arrivals.rates) {
        out << "arrival_rate bin=" << rate.bin_width_sec << " bins=" << rate.bins
            << " mean=" << rate.mean << " std=" << maybe{rate.stddev} << "\n";
    }
    for (unsigned hour = 0; hour < HOURS_PER_DAY; hour++) {
        out << "arrivals_by_hour hour=" << hour << " count=" << arrivals.by_hour[hour] << "\n";
    }
    out << "#arrivals_by_hour_std=" << maybe{arrivals.by_hour_stddev} << "\n";
    for (unsigned weekday = 0; weekday < DAYS_PER_WEEK; weekday++) {
        out << "arrivals_by_day_of_week day=" << weekday_name(weekday)
            << " count=" << arrivals.by_day_of_week[weekday] << "\n";
    }
    out << "#arrivals_by_day_of_week_std=" << maybe{arrivals.by_day_of_week_stddev} << "\n";
}

void print_windows(const vector<SessionWindow> & windows, const char * table, ostream & out) {
    for (const SessionWindow & session_window : windows) {
        const Window & w = session_window.window;
        out << table << " start=" << w.bin_start << " end=" << w.bin_end
            << " day=" << day2str(ts2Day_index(w.bin_start))
            << " count=" << w.count << " mean=" << w.mean;
        for (const auto & [level, value] : w.quantiles) {
            out << " p" << level * 100 << "=" << value;
        }
        print_fractions(session_window.fraction_at_least, out);
        out << "\n";
    }
    out << "#" << table << "_rows=" << windows.size() << "\n";
}

void print_hour_of_day(const vector<HourOfDayRecord> & records, const char * table, ostream & out) {
    for (const HourOfDayRecord & r : records) {
        out << table << " hour=" << r.hour << " mean=" << r.mean << " std=" << maybe{r.stddev}
            << " p10=" << r.p10 << " p90=" << r.p90 << " n=" << r.sample_count << "\n";
    }
    out << "#" << table << "_std_of_hourly_means=" << maybe{stddev_of_hourly_means(records)} << "\n";
}

void print_variance(const VarianceDecomposition & variance, const char * metric, ostream & out) {
    out << "variance metric=" << metric << " windows=" << variance.windows
        << " days=" << variance.days_observed
        << " global_cv=" << maybe{variance.global_cv};
    if (variance.intra_day.has_value()) {
        out << " intra_day_cv_mean=" << variance.intra_day->mean
            << " intra_day_cv_std=" << maybe{variance.intra_day->stddev}
            << " intra_day_days=" << variance.intra_day->days;
    } else {
        out << " intra_day_cv_mean=NA";
    }
    if (variance.inter_day.has_value()) {
        out << " inter_day_cv_mean=" << variance.inter_day->mean
            << " inter_day_hours=" << variance.inter_day->hours;
    } else {
        out << " inter_day_cv_mean=NA";
    }
    out << "\n";
}

void print_daily_curve_correlation(const vector<DailyCurve> & curves,
                                   const optional<CurveCorrelation> & correlation,
                                   ostream & out) {
    out << "#daily_curves=" << curves.size();
    if (correlation.has_value()) {
        out << " correlation_mean=" << correlation->mean
            << " correlation_std=" << correlation->stddev
            << " pairs=" << correlation->pairs;
    } else {
        out << " correlation_mean=NA";
    }
    out << "\n";
}

void print_concurrency(const vector<ConcurrencySummary> & summaries, ostream & out) {
    for (const ConcurrencySummary & s : summaries) {
        out << "concurrency model=" << s.label << " sessions=" << s.sessions
            << " peak=" << s.peak << " mean=" << s.mean << " median=" << s.median
            << " event_mean=" << s.event_mean << " event_median=" << s.event_median << "\n";
    }
}

void print_sensitivity(const vector<SensitivityRow> & rows, ostream & out) {
    for (const SensitivityRow & row : rows) {
        out << "sensitivity gap=" << row.label << " gap_sec=" << row.gap_threshold_sec;
        if (not row.result.has_value()) {
            out << " error=\"" << row.error << "\"\n";
            continue;
        }
        const SensitivityResult & r = row.result.value();
        out << " sessions=" << r.sessions;
        print_fractions(r.fraction_at_least, out);
        out << " avg_turns=" << r.mean_turn_count
            << " avg_turns_std_over_hours=" << maybe{r.hourly_mean_turn_count_stddev}
            << " windows=" << r.windows.size()
            << " retained_windows=" << r.retained_windows.size()
            << " retained_window_cv=" << maybe{r.retained_window_cv} << "\n";
    }
}

void print_analysis(const AnalysisResult & result, const bool print_session_rows, ostream & out) {
    out << setprecision(15);
    print_normalization(result.normalization, out);
    if (print_session_rows) {
        print_sessions(result.sessions, out);
    }
    print_session_depth(result.depth, out);
    print_arrivals(result.arrivals, out);
    print_windows(result.windows, "window", out);
    print_windows(result.retained_windows, "retained_window", out);
    print_hour_of_day(result.hour_of_day_windows, "hour_of_day_windows", out);
    print_hour_of_day(result.hour_of_day_sessions, "hour_of_day_sessions", out);
    print_variance(result.depth_variance, "mean_turns", out);
    print_variance(result.load_variance, "sessions_started", out);
    print_daily_curve_correlation(result.daily_curves, result.daily_curve_correlation, out);
    print_concurrency(result.concurrency, out);
    print_sensitivity(result.sensitivity, out);
}

Json::Value summary_json(const AnalysisResult & result) {
    Json::Value doc;

    Json::Value & normalization = doc["normalization"];
    normalization["records_in"] = Json::UInt64(result.normalization.records_in);
    normalization["records_out"] = Json::UInt64(result.normalization.records_out);
    normalization["dropped_timestamps"] = Json::UInt64(result.normalization.dropped_timestamps);
    normalization["out_of_range_timestamps"] = Json::UInt64(result.normalization.out_of_range_timestamps);
    normalization["duplicate_timestamps"] = Json::UInt64(result.normalization.duplicate_timestamps);
    normalization["span_days"] = result.normalization.span_days;
    normalization["explicit_session_ids"] = result.explicit_session_ids;

    Json::Value & depth = doc["session_depth"];
    depth["sessions"] = Json::UInt64(result.depth.sessions);
    depth["mean"] = result.depth.mean;
    depth["median"] = result.depth.median;
    depth["p90"] = result.depth.p90;
    depth["p95"] = result.depth.p95;
    depth["p99"] = result.depth.p99;
    depth["fraction_at_least"] = to_json(result.depth.fraction_at_least);

    Json::Value & arrivals = doc["arrivals"];
    arrivals["events"] = Json::UInt64(result.arrivals.events);
    if (result.arrivals.inter_arrival.has_value()) {
        const InterArrivalStats & gaps = result.arrivals.inter_arrival.value();
        arrivals["gap_mean"] = gaps.mean;
        arrivals["gap_median"] = gaps.median;
        arrivals["gap_p95"] = gaps.p95;
        arrivals["gap_min"] = gaps.min;
        arrivals["gap_max"] = gaps.max;
    }
    for (const ArrivalRate & rate : result.arrivals.rates) {
        Json::Value row;
        row["bin_width_sec"] = rate.bin_width_sec;
        row["bins"] = Json::UInt64(rate.bins);
        row["mean"] = rate.mean;
        row["std"] = to_json(rate.stddev);
        arrivals["rates"].append(row);
    }
    arrivals["by_hour_std"] = to_json(result.arrivals.by_hour_stddev);
    arrivals["by_day_of_week_std"] = to_json(result.arrivals.by_day_of_week_stddev);

    doc["windows"] = Json::UInt64(result.windows.size());
    doc["retained_windows"] = Json::UInt64(result.retained_windows.size());
    doc["hour_of_day_std_of_means"] = to_json(stddev_of_hourly_means(result.hour_of_day_sessions));

    doc["variance"]["mean_turns"] = variance_json(result.depth_variance);
    doc["variance"]["sessions_started"] = variance_json(result.load_variance);

    Json::Value & correlation = doc["daily_curve_correlation"];
    correlation["days"] = Json::UInt64(result.daily_curves.size());
    if (result.daily_curve_correlation.has_value()) {
        correlation["mean"] = result.daily_curve_correlation->mean;
        correlation["std"] = result.daily_curve_correlation->stddev;
        correlation["pairs"] = Json::UInt64(result.daily_curve_correlation->pairs);
    } else {
        correlation["mean"] = Json::nullValue;
    }

    for (const ConcurrencySummary & s : result.concurrency) {
        Json::Value & row = doc["concurrency"][s.label];
        row["peak"] = Json::Int64(s.peak);
        row["mean"] = s.mean;
        row["median"] = s.median;
        row["event_mean"] = s.event_mean;
        row["event_median"] = s.event_median;
    }

    for (const SensitivityRow & row : result.sensitivity) {
        Json::Value & entry = doc["sensitivity"][row.label];
        entry["gap_sec"] = row.gap_threshold_sec;
        if (not row.result.has_value()) {
            entry["error"] = row.error;
            continue;
        }
        const SensitivityResult & r = row.result.value();
        entry["sessions"] = Json::UInt64(r.sessions);
        entry["fraction_at_least"] = to_json(r.fraction_at_least);
        entry["avg_turns"] = r.mean_turn_count;
        entry["avg_turns_std_over_hours"] = to_json(r.hourly_mean_turn_count_stddev);
        entry["retained_windows"] = Json::UInt64(r.retained_windows.size());
    }

    return doc;
}

void write_json(const Json::Value & doc, ostream & out) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(doc, &out);
    out << "\n";
}
