#ifndef TRACEUTIL_HH
#define TRACEUTIL_HH

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/* Base of every error raised by the analytics core; the sensitivity
 * runner records these per setting. */
class trace_error : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};

/* No usable records remain after timestamp validation. */
class empty_input_error : public trace_error {
    public:
    using trace_error::trace_error;
};

/* Non-positive gap/bin width/multiplier, empty threshold lists, ... */
class invalid_parameter_error : public trace_error {
    public:
    using trace_error::trace_error;
};

/* A decomposition level's guard condition is never met. */
class insufficient_data_error : public trace_error {
    public:
    using trace_error::trace_error;
};

/* Returns max RSS in KiB; throws once the process grows past 12 GiB. */
size_t memcheck();

// if delimiter is at end, adds empty string to ret
void split_on_char(const std::string_view str, const char ch_to_find, std::vector<std::string_view> & ret);

/* Split on any run of spaces, tabs or commas (no empty fields). */
void split_on_separators(const std::string_view str, std::vector<std::string_view> & ret);

/* Empty if str is not entirely a (finite or infinite) floating-point number. */
std::optional<double> parse_double(const std::string_view str);

/* Empty if str is not entirely an integer; accepts a trailing ".0" as
 * produced by tools that store integer columns as floats. */
std::optional<int64_t> parse_int64(const std::string_view str);

void throw_if_not_positive(const double value, const std::string & name);

/* floor(value) as an int64_t. Throws invalid_parameter_error when the result
 * does not fit, so INT64_MIN (the hash-map empty key) is never produced. */
int64_t floor_to_int64(const double value, const std::string & name);

#endif
