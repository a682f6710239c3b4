#include <cmath>
#include <gtest/gtest.h>

#include "fixtures.hh"
#include "sensitivity.hh"
#include "traceutil.hh"

using namespace std;

namespace {

const vector<Event> events = conversation_events({0, 100, 1000, 3000, 3100, 7000});

SensitivityParams params_for(const vector<double> & gaps) {
    SensitivityParams params;
    params.gaps_sec = gaps;
    params.min_sessions_per_bin = 2;
    return params;
}

}

TEST(Sensitivity, GapLabels) {
    EXPECT_EQ(gap_label(900), "15m");
    EXPECT_EQ(gap_label(1800), "30m");
    EXPECT_EQ(gap_label(3600), "60m");
    EXPECT_EQ(gap_label(90), "90s");
}

TEST(Sensitivity, OneRowPerGapInOrder) {
    const vector<SensitivityRow> rows = run_gap_sensitivity(events, params_for({900, 1800, 3600, 60}));

    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].label, "15m");
    EXPECT_EQ(rows[3].label, "1m");

    ASSERT_TRUE(rows[0].result.has_value());
    EXPECT_TRUE(rows[0].error.empty());
    EXPECT_EQ(rows[0].result->sessions, 3u);
    EXPECT_DOUBLE_EQ(rows[0].result->mean_turn_count, 2);

    EXPECT_EQ(rows[1].result->sessions, 3u);
    EXPECT_EQ(rows[2].result->sessions, 2u);
    EXPECT_DOUBLE_EQ(rows[2].result->mean_turn_count, 3);
    EXPECT_EQ(rows[3].result->sessions, 6u);
}

TEST(Sensitivity, FractionsAreMonotoneInThreshold) {
    SensitivityParams params = params_for({900, 3600});
    params.turn_count_thresholds = {1, 2, 3, 4, 6};

    for (const SensitivityRow & row : run_gap_sensitivity(events, params)) {
        ASSERT_TRUE(row.result.has_value());
        const auto & fractions = row.result->fraction_at_least;
        ASSERT_EQ(fractions.size(), 5u);
        EXPECT_DOUBLE_EQ(fractions.front().second, 1);
        for (size_t i = 1; i < fractions.size(); i++) {
            EXPECT_LE(fractions[i].second, fractions[i - 1].second);
        }
    }

    const SensitivityResult r = run_gap_setting(events, 900, params_for({900}));
    EXPECT_DOUBLE_EQ(r.fraction_at_least[0].second, 2.0 / 3);
    EXPECT_DOUBLE_EQ(r.fraction_at_least[1].second, 1.0 / 3);
}

TEST(Sensitivity, HourlySpreadOfMeanTurns) {
    /* hour 0: sessions of 3 and 2 turns; hour 1: one of 1 turn */
    const SensitivityResult r = run_gap_setting(events, 900, params_for({900}));

    ASSERT_EQ(r.by_hour.size(), 2u);
    EXPECT_DOUBLE_EQ(r.by_hour[0].mean, 2.5);
    EXPECT_DOUBLE_EQ(r.by_hour[1].mean, 1);
    ASSERT_TRUE(r.hourly_mean_turn_count_stddev.has_value());
    EXPECT_DOUBLE_EQ(r.hourly_mean_turn_count_stddev.value(), 0.75 * sqrt(2.0));
}

TEST(Sensitivity, SparseWindowsAreFiltered) {
    const SensitivityResult r = run_gap_setting(events, 900, params_for({900}));

    ASSERT_EQ(r.windows.size(), 2u);
    ASSERT_EQ(r.retained_windows.size(), 1u);
    EXPECT_DOUBLE_EQ(r.retained_windows[0].window.bin_start, 0);
    EXPECT_EQ(r.retained_windows[0].window.count, 2u);
    /* a single retained window has no spread */
    EXPECT_FALSE(r.retained_window_cv.has_value());
}

TEST(Sensitivity, FailedSettingDoesNotHideOthers) {
    const vector<SensitivityRow> rows = run_gap_sensitivity(events, params_for({900, -1, 0, 3600}));

    ASSERT_EQ(rows.size(), 4u);
    EXPECT_TRUE(rows[0].result.has_value());
    EXPECT_FALSE(rows[1].result.has_value());
    EXPECT_FALSE(rows[1].error.empty());
    EXPECT_FALSE(rows[2].result.has_value());
    EXPECT_FALSE(rows[2].error.empty());
    ASSERT_TRUE(rows[3].result.has_value());
    EXPECT_EQ(rows[3].result->sessions, 2u);

    EXPECT_THROW(run_gap_setting(events, -1, params_for({})), invalid_parameter_error);
}

TEST(Sensitivity, EmptyTraceFailsEveryRow) {
    const vector<SensitivityRow> rows = run_gap_sensitivity({}, params_for({900, 1800}));

    ASSERT_EQ(rows.size(), 2u);
    for (const SensitivityRow & row : rows) {
        EXPECT_FALSE(row.result.has_value());
        EXPECT_FALSE(row.error.empty());
    }
}

TEST(Sensitivity, EmptyParameterListsAreRejected) {
    EXPECT_THROW(run_gap_sensitivity(events, params_for({})), invalid_parameter_error);

    SensitivityParams params = params_for({900});
    params.turn_count_thresholds.clear();
    EXPECT_THROW(run_gap_sensitivity(events, params), invalid_parameter_error);
}

TEST(SparseFilter, RetainedRowsMeetThreshold) {
    vector<Window> windows(5);
    const size_t counts[] = {1, 100, 99, 250, 0};
    for (size_t i = 0; i < windows.size(); i++) {
        windows[i].bin_start = i * 3600.0;
        windows[i].count = counts[i];
    }

    for (const size_t m : {size_t(0), size_t(1), size_t(100), size_t(1000)}) {
        const vector<Window> kept = filter_sparse_windows(windows, m);
        EXPECT_LE(kept.size(), windows.size());
        for (const Window & w : kept) {
            EXPECT_GE(w.count, m);
        }
    }

    const vector<Window> kept = filter_sparse_windows(windows, 100);
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_DOUBLE_EQ(kept[0].bin_start, 3600);
    EXPECT_DOUBLE_EQ(kept[1].bin_start, 3 * 3600);
    EXPECT_EQ(filter_sparse_windows(windows, 0).size(), windows.size());
}
