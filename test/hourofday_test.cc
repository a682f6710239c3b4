#include <cmath>
#include <gtest/gtest.h>

#include "fixtures.hh"
#include "hourofday.hh"

using namespace std;

TEST(HourOfDay, HourIgnoresCalendarDay) {
    EXPECT_EQ(hour_of_day(0), 0u);
    EXPECT_EQ(hour_of_day(3599), 0u);
    EXPECT_EQ(hour_of_day(3600), 1u);
    EXPECT_EQ(hour_of_day(5 * 86400 + 13 * 3600 + 59), 13u);
    EXPECT_EQ(hour_of_day(-1), 23u);
}

TEST(HourOfDay, GroupsAcrossDays) {
    const vector<Sample> samples = {
        {1 * 3600, 2},
        {86400 + 1 * 3600 + 30, 4},
        {2 * 86400 + 1 * 3600 + 60, 6},
        {5 * 3600, 10},
    };
    const vector<HourOfDayRecord> records = aggregate_hour_of_day(samples);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].hour, 1u);
    EXPECT_EQ(records[0].sample_count, 3u);
    EXPECT_DOUBLE_EQ(records[0].mean, 4);
    ASSERT_TRUE(records[0].stddev.has_value());
    EXPECT_DOUBLE_EQ(records[0].stddev.value(), 2);
    EXPECT_DOUBLE_EQ(records[0].p10, 2.4);
    EXPECT_DOUBLE_EQ(records[0].p90, 5.6);

    EXPECT_EQ(records[1].hour, 5u);
    EXPECT_FALSE(records[1].stddev.has_value());
}

TEST(HourOfDay, WindowsKeyedByBinStart) {
    vector<Window> windows(2);
    windows[0].bin_start = 3 * 3600;
    windows[0].mean = 1;
    windows[1].bin_start = 86400 + 3 * 3600;
    windows[1].mean = 3;

    const vector<HourOfDayRecord> records = aggregate_hour_of_day(windows);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].hour, 3u);
    EXPECT_DOUBLE_EQ(records[0].mean, 2);
}

TEST(HourOfDay, StddevOfHourlyMeans) {
    const session_table sessions = {
        make_session(0, 0, 10, 1),
        make_session(1, 3600, 3610, 3),
        make_session(2, 7200, 7210, 5),
    };
    const vector<HourOfDayRecord> records = aggregate_hour_of_day(sessions);

    ASSERT_EQ(records.size(), 3u);
    const optional<double> stddev = stddev_of_hourly_means(records);
    ASSERT_TRUE(stddev.has_value());
    EXPECT_DOUBLE_EQ(stddev.value(), 2);

    EXPECT_FALSE(stddev_of_hourly_means({records[0]}).has_value());
}

TEST(DailyCurves, OneCurvePerObservedDay) {
    const vector<Sample> samples = {
        {0 * 86400 + 0 * 3600, 1},
        {0 * 86400 + 0 * 3600 + 10, 3},
        {0 * 86400 + 4 * 3600, 5},
        {2 * 86400 + 4 * 3600, 7},
    };
    const vector<DailyCurve> curves = build_daily_curves(samples);

    ASSERT_EQ(curves.size(), 2u);
    EXPECT_EQ(curves[0].day, 0);
    ASSERT_TRUE(curves[0].values[0].has_value());
    EXPECT_DOUBLE_EQ(curves[0].values[0].value(), 2);
    EXPECT_DOUBLE_EQ(curves[0].values[4].value(), 5);
    EXPECT_FALSE(curves[0].values[1].has_value());
    EXPECT_EQ(curves[1].day, 2);
    EXPECT_DOUBLE_EQ(curves[1].values[4].value(), 7);
}

TEST(DailyCurves, CorrelationNeedsOverlap) {
    DailyCurve a{0, {}}, b{1, {}}, c{2, {}};
    for (unsigned hour = 0; hour < 8; hour++) {
        a.values[hour] = hour;
        b.values[hour] = 2.0 * hour + 1;
        c.values[hour] = 10.0 - hour;
    }

    const optional<CurveCorrelation> all = daily_curve_correlation({a, b, c}, 6);
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->pairs, 3u);
    /* +1, -1, -1 */
    EXPECT_NEAR(all->mean, -1.0 / 3, 1e-9);
    EXPECT_NEAR(all->stddev, sqrt(8.0) / 3, 1e-9);

    EXPECT_FALSE(daily_curve_correlation({a, b}, 9).has_value());
    EXPECT_FALSE(daily_curve_correlation({a}, 6).has_value());
}

TEST(DailyCurves, ConstantCurveIsSkipped) {
    DailyCurve a{0, {}}, flat{1, {}};
    for (unsigned hour = 0; hour < 8; hour++) {
        a.values[hour] = hour;
        flat.values[hour] = 4;
    }
    EXPECT_FALSE(daily_curve_correlation({a, flat}, 6).has_value());
}
