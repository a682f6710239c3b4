#include "traceutil.hh"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <sys/time.h>
#include <sys/resource.h>

using namespace std;
using namespace std::literals;

size_t memcheck() {
    rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) < 0) {
        perror("getrusage");
        throw runtime_error(string("getrusage: ") + strerror(errno));
    }

    if (usage.ru_maxrss > 12 * 1024 * 1024) {
        throw runtime_error("memory usage is at " + to_string(usage.ru_maxrss) + " KiB");
    }

    return usage.ru_maxrss;
}

void split_on_char(const string_view str, const char ch_to_find, vector<string_view> & ret) {
    ret.clear();

    bool in_double_quoted_string = false;
    unsigned int field_start = 0;   // start of next token
    for (unsigned int i = 0; i < str.size(); i++) {
        const char ch = str[i];
        if (ch == '"') {
            in_double_quoted_string = !in_double_quoted_string;
        } else if (in_double_quoted_string) {
            continue;
        } else if (ch == ch_to_find) {
            ret.emplace_back(str.substr(field_start, i - field_start));
            field_start = i + 1;
        }
    }

    ret.emplace_back(str.substr(field_start));
}

void split_on_separators(const string_view str, vector<string_view> & ret) {
    ret.clear();

    bool in_double_quoted_string = false;
    optional<size_t> field_start;
    for (size_t i = 0; i < str.size(); i++) {
        const char ch = str[i];
        if (ch == '"') {
            in_double_quoted_string = !in_double_quoted_string;
        }
        const bool separator = not in_double_quoted_string
                               and (ch == ' ' or ch == '\t' or ch == ',' or ch == '\r');
        if (separator) {
            if (field_start.has_value()) {
                ret.emplace_back(str.substr(field_start.value(), i - field_start.value()));
                field_start.reset();
            }
        } else if (not field_start.has_value()) {
            field_start.emplace(i);
        }
    }

    if (field_start.has_value()) {
        ret.emplace_back(str.substr(field_start.value()));
    }
}

optional<double> parse_double(const string_view str) {
    if (str.empty()) {
        return nullopt;
    }

    /* strtod needs a terminated buffer, and string_views into a line are not */
    const string terminated{str};
    char * end = nullptr;
    errno = 0;
    const double ret = strtod(terminated.c_str(), &end);
    if (end != terminated.c_str() + terminated.size() or errno == ERANGE) {
        return nullopt;
    }

    return ret;
}

optional<int64_t> parse_int64(string_view str) {
    if (str.size() > 2 and str.substr(str.size() - 2) == ".0"sv) {
        str.remove_suffix(2);
    }
    if (str.empty()) {
        return nullopt;
    }

    int64_t ret = 0;
    const auto [ptr, ec] = from_chars(str.data(), str.data() + str.size(), ret);
    if (ec != errc() or ptr != str.data() + str.size()) {
        return nullopt;
    }

    return ret;
}

void throw_if_not_positive(const double value, const string & name) {
    if (not (value > 0) or not isfinite(value)) {
        throw invalid_parameter_error(name + " must be positive, got " + to_string(value));
    }
}

int64_t floor_to_int64(const double value, const string & name) {
    const double floored = floor(value);
    if (not (floored > -0x1p63 and floored < 0x1p63)) {
        throw invalid_parameter_error(name + " out of range: " + to_string(value));
    }
    return static_cast<int64_t>(floored);
}
