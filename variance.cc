#include "variance.hh"

#include <algorithm>
#include <array>
#include <bitset>
#include <limits>
#include <map>
#include <tuple>
#include <google/dense_hash_map>
#include <boost/container_hash/hash.hpp>

#include "dateutil.hh"
#include "statsutil.hh"
#include "traceutil.hh"

using namespace std;
using google::dense_hash_map;

double VarianceDecomposition::global_cv_or_throw() const {
    if (not global_cv.has_value()) {
        throw insufficient_data_error("global CV undefined: fewer than two windows or non-positive mean");
    }
    return global_cv.value();
}

const IntraDayCV & VarianceDecomposition::intra_day_or_throw() const {
    if (not intra_day.has_value()) {
        throw insufficient_data_error("intra-day CV undefined: no day has enough windows with a positive mean");
    }
    return intra_day.value();
}

const InterDayCV & VarianceDecomposition::inter_day_or_throw() const {
    if (not inter_day.has_value()) {
        throw insufficient_data_error("inter-day CV undefined: no hour of day recurs with a positive mean");
    }
    return inter_day.value();
}

VarianceDecomposition decompose_variance(const vector<Sample> & series, const size_t min_windows_per_day) {
    if (series.empty()) {
        throw empty_input_error("no windows to decompose");
    }

    VarianceDecomposition ret;
    ret.windows = series.size();

    vector<double> all_values;
    all_values.reserve(series.size());
    for (const Sample & sample : series) {
        all_values.push_back(sample.value);
    }
    ret.global_cv = coefficient_of_variation(all_values);

    /* intra-day */
    dense_hash_map<Day_index, vector<const Sample *>> by_day;
    by_day.set_empty_key(numeric_limits<Day_index>::min());
    for (const Sample & sample : series) {
        by_day[ts2Day_index(sample.timestamp)].push_back(&sample);
    }
    ret.days_observed = by_day.size();

    /* ordered, so the reported statistics do not depend on hash order */
    map<Day_index, double> daily_cv;
    for (const auto & [day, samples] : by_day) {
        bitset<HOURS_PER_DAY> hours;
        vector<double> values;
        for (const Sample * sample : samples) {
            hours.set(hour_of_day(sample->timestamp));
            values.push_back(sample->value);
        }
        if (hours.count() < min_windows_per_day) {
            continue;
        }
        const optional<double> cv = coefficient_of_variation(values);
        if (cv.has_value()) {
            daily_cv[day] = cv.value();
        }
    }
    if (not daily_cv.empty()) {
        vector<double> cvs;
        for (const auto & [day, cv] : daily_cv) {
            cvs.push_back(cv);
        }
        ret.intra_day = IntraDayCV{sample_mean(cvs), sample_stddev(cvs), cvs.size()};
    }

    /* inter-day: one value per (day, hour), then the spread across days */
    using cell_key = tuple<Day_index, unsigned>;
    /*                     day,       hour */
    dense_hash_map<cell_key, pair<double, size_t>, boost::hash<cell_key>> cells;
    cells.set_empty_key({numeric_limits<Day_index>::min(), HOURS_PER_DAY});
    for (const Sample & sample : series) {
        auto & [sum, count] = cells[{ts2Day_index(sample.timestamp), hour_of_day(sample.timestamp)}];
        sum += sample.value;
        count++;
    }

    vector<pair<cell_key, double>> cell_means;
    cell_means.reserve(cells.size());
    for (const auto & [key, cell] : cells) {
        cell_means.emplace_back(key, cell.first / cell.second);
    }
    sort(cell_means.begin(), cell_means.end());

    array<vector<double>, HOURS_PER_DAY> by_hour{};
    for (const auto & [key, mean] : cell_means) {
        by_hour.at(get<1>(key)).push_back(mean);
    }
    vector<double> hourly_cvs;
    for (const auto & day_values : by_hour) {
        if (day_values.size() < 2) {
            continue;
        }
        const optional<double> cv = coefficient_of_variation(day_values);
        if (cv.has_value()) {
            hourly_cvs.push_back(cv.value());
        }
    }
    if (not hourly_cvs.empty()) {
        ret.inter_day = InterDayCV{sample_mean(hourly_cvs), hourly_cvs.size()};
    }

    return ret;
}

VarianceDecomposition decompose_variance(const vector<Window> & windows,
                                         const WindowMetric metric,
                                         const size_t min_windows_per_day) {
    vector<Sample> series;
    series.reserve(windows.size());
    for (const Window & window : windows) {
        const double value = metric == WindowMetric::mean ? window.mean : double(window.count);
        series.push_back({window.bin_start, value});
    }
    return decompose_variance(series, min_windows_per_day);
}
