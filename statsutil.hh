/* Descriptive statistics shared by the aggregators. */

#ifndef STATSUTIL_HH
#define STATSUTIL_HH

#include <optional>
#include <vector>

/* Arithmetic mean; throws logic_error on an empty sample. */
double sample_mean(const std::vector<double> & values);

/* Standard deviation with Bessel's correction (ddof=1).
 * Empty with fewer than two samples. */
std::optional<double> sample_stddev(const std::vector<double> & values);

/* Population standard deviation (ddof=0); throws on an empty sample. */
double population_stddev(const std::vector<double> & values);

/* Quantile q in [0,1] of an ascending-sorted sample, interpolating linearly
 * between the order statistics at floor and ceil of q * (n - 1). */
double quantile_sorted(const std::vector<double> & sorted, const double q);

/* As quantile_sorted, sorting a copy first. */
double quantile(std::vector<double> values, const double q);

double median(std::vector<double> values);

/* std / mean with ddof=1. Empty when the mean is not positive or the
 * standard deviation is undefined; callers must not read absence as zero. */
std::optional<double> coefficient_of_variation(const std::vector<double> & values);

/* Pearson correlation; empty when either side is constant or n < 2. */
std::optional<double> pearson_correlation(const std::vector<double> & x, const std::vector<double> & y);

#endif
