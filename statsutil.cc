#include "statsutil.hh"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

using namespace std;

double sample_mean(const vector<double> & values) {
    if (values.empty()) {
        throw logic_error("mean of empty sample");
    }
    return accumulate(values.begin(), values.end(), 0.0) / values.size();
}

optional<double> sample_stddev(const vector<double> & values) {
    if (values.size() < 2) {
        return nullopt;
    }

    const double mean = sample_mean(values);
    double ssr = 0;
    for ( const auto x : values ) {
        ssr += (x - mean) * (x - mean);
    }
    const double variance = (1.0 / (values.size() - 1)) * ssr;
    return sqrt(variance);
}

double population_stddev(const vector<double> & values) {
    const double mean = sample_mean(values);
    double ssr = 0;
    for ( const auto x : values ) {
        ssr += (x - mean) * (x - mean);
    }
    return sqrt(ssr / values.size());
}

double quantile_sorted(const vector<double> & sorted, const double q) {
    if (sorted.empty()) {
        throw logic_error("quantile of empty sample");
    }
    if (not (q >= 0 and q <= 1)) {
        throw logic_error("quantile level out of range: " + to_string(q));
    }

    const double position = q * (sorted.size() - 1);
    const size_t lower = static_cast<size_t>(floor(position));
    const size_t upper = static_cast<size_t>(ceil(position));
    const double fraction = position - lower;

    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

double quantile(vector<double> values, const double q) {
    sort(values.begin(), values.end());
    return quantile_sorted(values, q);
}

double median(vector<double> values) {
    return quantile(move(values), 0.5);
}

optional<double> coefficient_of_variation(const vector<double> & values) {
    if (values.empty()) {
        return nullopt;
    }
    const double mean = sample_mean(values);
    const optional<double> stddev = sample_stddev(values);
    if (not (mean > 0) or not stddev.has_value()) {
        return nullopt;
    }
    return stddev.value() / mean;
}

optional<double> pearson_correlation(const vector<double> & x, const vector<double> & y) {
    if (x.size() != y.size()) {
        throw logic_error("pearson_correlation: samples differ in length");
    }
    if (x.size() < 2) {
        return nullopt;
    }

    const double mean_x = sample_mean(x);
    const double mean_y = sample_mean(y);
    double sxy = 0, sxx = 0, syy = 0;
    for ( size_t i = 0; i < x.size(); i++ ) {
        sxy += (x[i] - mean_x) * (y[i] - mean_y);
        sxx += (x[i] - mean_x) * (x[i] - mean_x);
        syy += (y[i] - mean_y) * (y[i] - mean_y);
    }

    if (sxx == 0 or syy == 0) {
        return nullopt;
    }
    return sxy / sqrt(sxx * syy);
}
