#include "config.hh"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <jsoncpp/json/json.h>

#include "traceutil.hh"

using namespace std;

namespace {

void throw_if_empty(const size_t size, const string & name) {
    if (size == 0) {
        throw invalid_parameter_error(name + " must not be empty");
    }
}

double json_number(const Json::Value & value, const string & key) {
    if (not value.isNumeric()) {
        throw invalid_parameter_error(key + ": expected a number");
    }
    return value.asDouble();
}

size_t json_count(const Json::Value & value, const string & key) {
    const double number = json_number(value, key);
    if (number < 0 or number != floor(number) or number > numeric_limits<uint32_t>::max()) {
        throw invalid_parameter_error(key + ": expected a non-negative integer");
    }
    return size_t(number);
}

vector<double> json_number_list(const Json::Value & value, const string & key) {
    if (not value.isArray()) {
        throw invalid_parameter_error(key + ": expected an array of numbers");
    }
    vector<double> ret;
    for (const Json::Value & element : value) {
        ret.push_back(json_number(element, key));
    }
    return ret;
}

vector<unsigned> json_count_list(const Json::Value & value, const string & key) {
    if (not value.isArray()) {
        throw invalid_parameter_error(key + ": expected an array of integers");
    }
    vector<unsigned> ret;
    for (const Json::Value & element : value) {
        ret.push_back(unsigned(json_count(element, key)));
    }
    return ret;
}

}

void AnalysisConfig::validate() const {
    throw_if_not_positive(gap_threshold_sec, "gapThresholdSec");
    throw_if_not_positive(bin_width_sec, "binWidthSec");

    throw_if_empty(duration_model_multipliers.size(), "durationModelMultipliers");
    for (const double k : duration_model_multipliers) {
        throw_if_not_positive(k, "durationModelMultipliers");
    }

    throw_if_empty(turn_count_thresholds.size(), "turnCountThresholds");
    for (const unsigned k : turn_count_thresholds) {
        if (k == 0) {
            throw invalid_parameter_error("turnCountThresholds must be positive");
        }
    }

    /* individual gaps are checked per setting by the sensitivity runner */
    throw_if_empty(sensitivity_gaps_sec.size(), "sensitivityGapsSec");

    for (const double q : quantiles) {
        if (not (q >= 0 and q <= 1)) {
            throw invalid_parameter_error("quantiles must lie in [0, 1]");
        }
    }

    if (min_days_overlap_for_correlation < 2) {
        throw invalid_parameter_error("minDaysOverlapForCorrelation must be at least 2");
    }
    if (min_windows_per_day < 2) {
        throw invalid_parameter_error("minWindowsPerDay must be at least 2");
    }
}

SensitivityParams AnalysisConfig::sensitivity_params() const {
    SensitivityParams ret;
    ret.gaps_sec = sensitivity_gaps_sec;
    ret.bin_width_sec = bin_width_sec;
    ret.turn_count_thresholds = turn_count_thresholds;
    ret.min_sessions_per_bin = min_session_count_per_bin;
    ret.quantiles = quantiles;
    return ret;
}

void apply_config_json(const string & json_text, AnalysisConfig & config) {
    Json::Reader reader;
    Json::Value doc;
    if (not reader.parse(json_text, doc)) {
        throw invalid_parameter_error("config: " + reader.getFormattedErrorMessages());
    }
    if (not doc.isObject()) {
        throw invalid_parameter_error("config: expected a JSON object");
    }

    for (const string & key : doc.getMemberNames()) {
        const Json::Value & value = doc[key];
        if (key == "gapThresholdSec") {
            config.gap_threshold_sec = json_number(value, key);
        } else if (key == "binWidthSec") {
            config.bin_width_sec = json_number(value, key);
        } else if (key == "minSessionCountPerBin") {
            config.min_session_count_per_bin = json_count(value, key);
        } else if (key == "durationModelMultipliers") {
            config.duration_model_multipliers = json_number_list(value, key);
        } else if (key == "turnCountThresholds") {
            config.turn_count_thresholds = json_count_list(value, key);
        } else if (key == "sensitivityGapsSec") {
            config.sensitivity_gaps_sec = json_number_list(value, key);
        } else if (key == "quantiles") {
            config.quantiles = json_number_list(value, key);
        } else if (key == "minDaysOverlapForCorrelation") {
            config.min_days_overlap_for_correlation = json_count(value, key);
        } else if (key == "minWindowsPerDay") {
            config.min_windows_per_day = json_count(value, key);
        } else {
            throw invalid_parameter_error("config: unknown key \"" + key + "\"");
        }
    }
}

void load_config_file(const string & filename, AnalysisConfig & config) {
    ifstream file{filename};
    if (not file.is_open()) {
        throw runtime_error("can't open " + filename);
    }
    ostringstream contents;
    contents << file.rdbuf();
    apply_config_json(contents.str(), config);
}

vector<double> parse_number_list(const string & list) {
    vector<string_view> fields;
    split_on_char(list, ',', fields);

    vector<double> ret;
    for (const string_view field : fields) {
        const optional<double> value = parse_double(field);
        if (not value.has_value()) {
            throw invalid_parameter_error("not a number: \"" + string(field) + "\"");
        }
        ret.push_back(value.value());
    }
    return ret;
}

vector<unsigned> parse_unsigned_list(const string & list) {
    vector<unsigned> ret;
    for (const double value : parse_number_list(list)) {
        if (value < 0 or value != floor(value) or value > numeric_limits<unsigned>::max()) {
            throw invalid_parameter_error("not a non-negative integer: " + to_string(value));
        }
        ret.push_back(unsigned(value));
    }
    return ret;
}

double parse_single_number(const string & value) {
    const vector<double> ret = parse_number_list(value);
    if (ret.size() != 1) {
        throw invalid_parameter_error("expected a single number, got \"" + value + "\"");
    }
    return ret.front();
}

unsigned parse_single_unsigned(const string & value) {
    const vector<unsigned> ret = parse_unsigned_list(value);
    if (ret.size() != 1) {
        throw invalid_parameter_error("expected a single integer, got \"" + value + "\"");
    }
    return ret.front();
}
