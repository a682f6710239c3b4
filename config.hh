#ifndef CONFIG_HH
#define CONFIG_HH

#include <cstddef>
#include <string>
#include <vector>

#include "concurrency.hh"
#include "hourofday.hh"
#include "sensitivity.hh"
#include "sessions.hh"
#include "variance.hh"
#include "windows.hh"

/* Every tunable of one analysis run. JSON keys are given beside each field. */
struct AnalysisConfig {
    double gap_threshold_sec = DEFAULT_GAP_THRESHOLD_SEC;                   // gapThresholdSec
    double bin_width_sec = DEFAULT_BIN_WIDTH_SEC;                           // binWidthSec
    size_t min_session_count_per_bin = DEFAULT_MIN_SESSIONS_PER_BIN;        // minSessionCountPerBin
    std::vector<double> duration_model_multipliers = DEFAULT_DURATION_MULTIPLIERS;  // durationModelMultipliers
    std::vector<unsigned> turn_count_thresholds = DEFAULT_TURN_COUNT_THRESHOLDS;    // turnCountThresholds
    std::vector<double> sensitivity_gaps_sec = DEFAULT_SENSITIVITY_GAPS;    // sensitivityGapsSec
    std::vector<double> quantiles = DEFAULT_WINDOW_QUANTILES;               // quantiles
    size_t min_days_overlap_for_correlation = DEFAULT_MIN_CURVE_OVERLAP;    // minDaysOverlapForCorrelation
    size_t min_windows_per_day = DEFAULT_MIN_WINDOWS_PER_DAY;               // minWindowsPerDay

    /* Throws invalid_parameter_error on the first bad value. A bad entry of
     * sensitivity_gaps_sec is not an error here; it fails only its own row. */
    void validate() const;

    SensitivityParams sensitivity_params() const;
};

/* Overlay the keys present in a JSON object onto config. Unknown keys and
 * values of the wrong type throw invalid_parameter_error; the result is
 * not validated. */
void apply_config_json(const std::string & json_text, AnalysisConfig & config);

/* apply_config_json on a file's contents. */
void load_config_file(const std::string & filename, AnalysisConfig & config);

/* "900,1800,3600" */
std::vector<double> parse_number_list(const std::string & list);
std::vector<unsigned> parse_unsigned_list(const std::string & list);

/* Exactly one value, for scalar command-line flags. */
double parse_single_number(const std::string & value);
unsigned parse_single_unsigned(const std::string & value);

#endif
