#include <gtest/gtest.h>

#include "dateutil.hh"
#include "fixtures.hh"
#include "traceutil.hh"
#include "windows.hh"

using namespace std;

TEST(Windows, BinsByFlooredStart) {
    const vector<Sample> samples = {{10, 1}, {3599, 3}, {3600, 5}, {7300, 2}, {7400, 4}};
    const vector<Window> windows = aggregate_windows(samples, 3600);

    ASSERT_EQ(windows.size(), 3u);
    EXPECT_DOUBLE_EQ(windows[0].bin_start, 0);
    EXPECT_DOUBLE_EQ(windows[0].bin_end, 3600);
    EXPECT_EQ(windows[0].count, 2u);
    EXPECT_DOUBLE_EQ(windows[0].mean, 2);
    EXPECT_DOUBLE_EQ(windows[1].bin_start, 3600);
    EXPECT_EQ(windows[1].count, 1u);
    EXPECT_DOUBLE_EQ(windows[2].bin_start, 7200);
    EXPECT_DOUBLE_EQ(windows[2].mean, 3);
}

TEST(Windows, EmptyBinsAreNotEmitted) {
    const vector<Sample> samples = {{0, 1}, {10 * 3600 + 5, 1}};
    const vector<Window> windows = aggregate_windows(samples, 3600);

    ASSERT_EQ(windows.size(), 2u);
    EXPECT_DOUBLE_EQ(windows[1].bin_start, 36000);
}

TEST(Windows, OutputIsInBinOrderRegardlessOfInputOrder) {
    const vector<Sample> samples = {{7300, 1}, {10, 1}, {3700, 1}, {-10, 1}};
    const vector<Window> windows = aggregate_windows(samples, 3600);

    ASSERT_EQ(windows.size(), 4u);
    EXPECT_DOUBLE_EQ(windows[0].bin_start, -3600);
    for (size_t i = 1; i < windows.size(); i++) {
        EXPECT_LT(windows[i - 1].bin_start, windows[i].bin_start);
    }
}

TEST(Windows, QuantilesInterpolateLinearly) {
    vector<Sample> samples;
    for (int v = 1; v <= 11; v++) {
        samples.push_back({double(v), double(v)});
    }
    const vector<Window> windows = aggregate_windows(samples, 3600, {0.5, 0.9, 0.95});

    ASSERT_EQ(windows.size(), 1u);
    EXPECT_DOUBLE_EQ(windows[0].quantile(0.5), 6);
    EXPECT_DOUBLE_EQ(windows[0].quantile(0.9), 10);
    EXPECT_DOUBLE_EQ(windows[0].quantile(0.95), 10.5);
    EXPECT_THROW(windows[0].quantile(0.99), out_of_range);
}

TEST(Windows, RebinningIsIdempotent) {
    const vector<Sample> samples = {{5, 2}, {4000, 3}, {4100, 8}, {90000, 1}, {3599.5, 7}};
    const vector<Window> first = aggregate_windows(samples, 1800);
    const vector<Window> second = aggregate_windows(samples, 1800);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i].bin_start, second[i].bin_start);
        EXPECT_EQ(first[i].count, second[i].count);
        EXPECT_EQ(first[i].mean, second[i].mean);
        EXPECT_EQ(first[i].quantiles, second[i].quantiles);
    }
}

TEST(Windows, RejectsBadParameters) {
    const vector<Sample> samples = {{0, 1}};
    EXPECT_THROW(aggregate_windows(samples, 0), invalid_parameter_error);
    EXPECT_THROW(aggregate_windows(samples, -60), invalid_parameter_error);
    EXPECT_THROW(aggregate_windows(samples, 60, {1.5}), invalid_parameter_error);
}

TEST(Windows, SessionWindowsReportThresholdFractions) {
    const session_table sessions = {
        make_session(0, 0, 100, 1),
        make_session(1, 200, 300, 2),
        make_session(2, 400, 900, 5),
        make_session(3, 3000, 3100, 3),
        make_session(4, 4000, 4000, 1),
    };
    const vector<SessionWindow> windows = aggregate_session_windows(sessions, 3600, {2, 3});

    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0].window.count, 4u);
    EXPECT_DOUBLE_EQ(windows[0].window.mean, 11.0 / 4);
    ASSERT_EQ(windows[0].fraction_at_least.size(), 2u);
    EXPECT_EQ(windows[0].fraction_at_least[0].first, 2u);
    EXPECT_DOUBLE_EQ(windows[0].fraction_at_least[0].second, 0.75);
    EXPECT_DOUBLE_EQ(windows[0].fraction_at_least[1].second, 0.5);
    EXPECT_DOUBLE_EQ(windows[1].fraction_at_least[0].second, 0);
}

TEST(Windows, ArrivalSamplesCountEvents) {
    const auto events = conversation_events({0, 1, 2, 61, 3600});
    const vector<Window> windows = aggregate_windows(event_arrival_samples(events), 60, {});

    ASSERT_EQ(windows.size(), 3u);
    EXPECT_EQ(windows[0].count, 3u);
    EXPECT_EQ(windows[1].count, 1u);
    EXPECT_EQ(windows[2].count, 1u);
    EXPECT_TRUE(windows[0].quantiles.empty());
}

TEST(Windows, RejectsTimestampsWithoutAnIntegerBin) {
    EXPECT_THROW(aggregate_windows({{1e300, 1}, {5, 2}}, 3600), invalid_parameter_error);
    EXPECT_THROW(aggregate_windows({{1e9, 1}}, 1e-12), invalid_parameter_error);
    EXPECT_THROW(ts2Day_index(1e300), invalid_parameter_error);
    EXPECT_THROW(ts2Day_index(-1e300), invalid_parameter_error);
    EXPECT_EQ(ts2Day_index(-1), -1);
}
