#include "hourofday.hh"

#include <algorithm>
#include <limits>
#include <tuple>
#include <google/dense_hash_map>
#include <boost/container_hash/hash.hpp>

#include "statsutil.hh"

using namespace std;
using google::dense_hash_map;

vector<HourOfDayRecord> aggregate_hour_of_day(const vector<Sample> & samples) {
    array<vector<double>, HOURS_PER_DAY> by_hour{};
    for (const Sample & sample : samples) {
        by_hour.at(hour_of_day(sample.timestamp)).push_back(sample.value);
    }

    vector<HourOfDayRecord> ret;
    for (unsigned hour = 0; hour < HOURS_PER_DAY; hour++) {
        vector<double> & values = by_hour[hour];
        if (values.empty()) {
            continue;
        }
        sort(values.begin(), values.end());

        HourOfDayRecord record;
        record.hour = hour;
        record.mean = sample_mean(values);
        record.stddev = sample_stddev(values);
        record.p10 = quantile_sorted(values, 0.10);
        record.p90 = quantile_sorted(values, 0.90);
        record.sample_count = values.size();
        ret.push_back(record);
    }

    return ret;
}

vector<HourOfDayRecord> aggregate_hour_of_day(const vector<Window> & windows) {
    return aggregate_hour_of_day(window_mean_samples(windows));
}

vector<HourOfDayRecord> aggregate_hour_of_day(const session_table & sessions) {
    return aggregate_hour_of_day(session_turn_samples(sessions));
}

optional<double> stddev_of_hourly_means(const vector<HourOfDayRecord> & records) {
    vector<double> means;
    means.reserve(records.size());
    for (const auto & record : records) {
        means.push_back(record.mean);
    }
    return sample_stddev(means);
}

vector<DailyCurve> build_daily_curves(const vector<Sample> & samples) {
    using cell_key = tuple<Day_index, unsigned>;
    /*                     day,       hour */
    // cells[cell_key] = (sum, count)
    dense_hash_map<cell_key, pair<double, size_t>, boost::hash<cell_key>> cells;
    cells.set_empty_key({numeric_limits<Day_index>::min(), HOURS_PER_DAY});

    for (const Sample & sample : samples) {
        auto & [sum, count] = cells[{ts2Day_index(sample.timestamp), hour_of_day(sample.timestamp)}];
        sum += sample.value;
        count++;
    }

    vector<cell_key> keys;
    keys.reserve(cells.size());
    for (const auto & cell : cells) {
        keys.push_back(cell.first);
    }
    sort(keys.begin(), keys.end());

    vector<DailyCurve> ret;
    for (const auto & key : keys) {
        const auto & [day, hour] = key;
        if (ret.empty() or ret.back().day != day) {
            ret.push_back({day, {}});
        }
        const auto & [sum, count] = cells[key];
        ret.back().values.at(hour).emplace(sum / count);
    }

    return ret;
}

optional<CurveCorrelation> daily_curve_correlation(const vector<DailyCurve> & curves, const size_t min_overlap) {
    vector<double> correlations;

    for (size_t i = 0; i < curves.size(); i++) {
        for (size_t j = i + 1; j < curves.size(); j++) {
            vector<double> x, y;
            for (unsigned hour = 0; hour < HOURS_PER_DAY; hour++) {
                const auto & a = curves[i].values[hour];
                const auto & b = curves[j].values[hour];
                if (a.has_value() and b.has_value()) {
                    x.push_back(a.value());
                    y.push_back(b.value());
                }
            }
            if (x.size() < min_overlap) {
                continue;
            }
            const optional<double> r = pearson_correlation(x, y);
            if (r.has_value()) {
                correlations.push_back(r.value());
            }
        }
    }

    if (correlations.empty()) {
        return nullopt;
    }

    CurveCorrelation ret;
    ret.mean = sample_mean(correlations);
    ret.stddev = population_stddev(correlations);
    ret.pairs = correlations.size();
    return ret;
}
