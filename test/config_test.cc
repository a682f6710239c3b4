#include <gtest/gtest.h>

#include "config.hh"
#include "traceutil.hh"

using namespace std;

TEST(Config, DefaultsAreValid) {
    const AnalysisConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.gap_threshold_sec, 1800);
    EXPECT_DOUBLE_EQ(config.bin_width_sec, 3600);
    EXPECT_EQ(config.min_session_count_per_bin, 100u);
    EXPECT_EQ(config.duration_model_multipliers, (vector<double>{10, 30}));
    EXPECT_EQ(config.turn_count_thresholds, (vector<unsigned>{2, 3}));
    EXPECT_EQ(config.sensitivity_gaps_sec, (vector<double>{900, 1800, 3600}));
    EXPECT_EQ(config.min_days_overlap_for_correlation, 6u);
    EXPECT_EQ(config.min_windows_per_day, 6u);
}

TEST(Config, JsonOverridesOnlyGivenKeys) {
    AnalysisConfig config;
    apply_config_json(R"({"gapThresholdSec": 600, "turnCountThresholds": [2, 5, 10],
                          "quantiles": [0.5], "minSessionCountPerBin": 20})", config);

    EXPECT_DOUBLE_EQ(config.gap_threshold_sec, 600);
    EXPECT_EQ(config.turn_count_thresholds, (vector<unsigned>{2, 5, 10}));
    EXPECT_EQ(config.quantiles, (vector<double>{0.5}));
    EXPECT_EQ(config.min_session_count_per_bin, 20u);
    EXPECT_DOUBLE_EQ(config.bin_width_sec, 3600);
    EXPECT_NO_THROW(config.validate());
}

TEST(Config, JsonRejectsUnknownKeysAndBadTypes) {
    AnalysisConfig config;
    EXPECT_THROW(apply_config_json(R"({"gapThreshold": 600})", config), invalid_parameter_error);
    EXPECT_THROW(apply_config_json(R"({"binWidthSec": "hourly"})", config), invalid_parameter_error);
    EXPECT_THROW(apply_config_json(R"({"turnCountThresholds": [2.5]})", config), invalid_parameter_error);
    EXPECT_THROW(apply_config_json(R"({"sensitivityGapsSec": 900})", config), invalid_parameter_error);
    EXPECT_THROW(apply_config_json("[1, 2]", config), invalid_parameter_error);
    EXPECT_THROW(apply_config_json("{not json", config), invalid_parameter_error);
}

TEST(Config, ValidateRejectsBadValues) {
    AnalysisConfig config;
    config.gap_threshold_sec = 0;
    EXPECT_THROW(config.validate(), invalid_parameter_error);

    config = AnalysisConfig{};
    config.bin_width_sec = -3600;
    EXPECT_THROW(config.validate(), invalid_parameter_error);

    config = AnalysisConfig{};
    config.duration_model_multipliers.clear();
    EXPECT_THROW(config.validate(), invalid_parameter_error);

    config = AnalysisConfig{};
    config.turn_count_thresholds.clear();
    EXPECT_THROW(config.validate(), invalid_parameter_error);

    config = AnalysisConfig{};
    config.sensitivity_gaps_sec.clear();
    EXPECT_THROW(config.validate(), invalid_parameter_error);

    /* a bad gap fails only its own sensitivity row */
    config = AnalysisConfig{};
    config.sensitivity_gaps_sec = {900, 0};
    EXPECT_NO_THROW(config.validate());

    config = AnalysisConfig{};
    config.quantiles = {0.9, 1.1};
    EXPECT_THROW(config.validate(), invalid_parameter_error);
}

TEST(Config, NumberLists) {
    EXPECT_EQ(parse_number_list("900,1800,3600"), (vector<double>{900, 1800, 3600}));
    EXPECT_EQ(parse_number_list("2.5"), (vector<double>{2.5}));
    EXPECT_EQ(parse_unsigned_list("2,3"), (vector<unsigned>{2, 3}));
    EXPECT_THROW(parse_number_list("900,,3600"), invalid_parameter_error);
    EXPECT_THROW(parse_unsigned_list("2,-3"), invalid_parameter_error);
    EXPECT_THROW(parse_unsigned_list("1.5"), invalid_parameter_error);
}

TEST(Config, ScalarFlagsTakeExactlyOneValue) {
    EXPECT_DOUBLE_EQ(parse_single_number("900"), 900);
    EXPECT_EQ(parse_single_unsigned("3"), 3u);
    EXPECT_THROW(parse_single_number("900,1800"), invalid_parameter_error);
    EXPECT_THROW(parse_single_unsigned("3,4"), invalid_parameter_error);
    EXPECT_THROW(parse_single_number(""), invalid_parameter_error);
}

TEST(Config, SensitivityParamsFollowConfig) {
    AnalysisConfig config;
    config.sensitivity_gaps_sec = {60};
    config.min_session_count_per_bin = 3;
    const SensitivityParams params = config.sensitivity_params();

    EXPECT_EQ(params.gaps_sec, (vector<double>{60}));
    EXPECT_EQ(params.min_sessions_per_bin, 3u);
    EXPECT_DOUBLE_EQ(params.bin_width_sec, config.bin_width_sec);
}
