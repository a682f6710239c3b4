#include <cmath>
#include <stdexcept>
#include <gtest/gtest.h>

#include "statsutil.hh"

using namespace std;

TEST(Stats, MeanAndStddev) {
    const vector<double> values = {2, 4, 4, 4, 5, 5, 7, 9};

    EXPECT_DOUBLE_EQ(sample_mean(values), 5);
    EXPECT_DOUBLE_EQ(population_stddev(values), 2);
    ASSERT_TRUE(sample_stddev(values).has_value());
    EXPECT_DOUBLE_EQ(sample_stddev(values).value(), sqrt(32.0 / 7));

    EXPECT_FALSE(sample_stddev({3}).has_value());
    EXPECT_THROW(sample_mean({}), logic_error);
}

TEST(Stats, Quantiles) {
    EXPECT_DOUBLE_EQ(quantile({4, 1, 3, 2}, 0), 1);
    EXPECT_DOUBLE_EQ(quantile({4, 1, 3, 2}, 1), 4);
    EXPECT_DOUBLE_EQ(median({4, 1, 3, 2}), 2.5);
    EXPECT_DOUBLE_EQ(median({7}), 7);
    EXPECT_DOUBLE_EQ(quantile_sorted({10, 20}, 0.25), 12.5);
    EXPECT_THROW(quantile({}, 0.5), logic_error);
}

TEST(Stats, CoefficientOfVariation) {
    ASSERT_TRUE(coefficient_of_variation({2, 2, 2}).has_value());
    EXPECT_DOUBLE_EQ(coefficient_of_variation({2, 2, 2}).value(), 0);
    EXPECT_DOUBLE_EQ(coefficient_of_variation({1, 3}).value(), sqrt(2.0) / 2);

    /* absent, not zero */
    EXPECT_FALSE(coefficient_of_variation({}).has_value());
    EXPECT_FALSE(coefficient_of_variation({5}).has_value());
    EXPECT_FALSE(coefficient_of_variation({0, 0, 0}).has_value());
    EXPECT_FALSE(coefficient_of_variation({-1, 1}).has_value());
}

TEST(Stats, PearsonCorrelation) {
    EXPECT_NEAR(pearson_correlation({1, 2, 3}, {2, 4, 6}).value(), 1, 1e-12);
    EXPECT_NEAR(pearson_correlation({1, 2, 3}, {3, 2, 1}).value(), -1, 1e-12);
    EXPECT_FALSE(pearson_correlation({1, 2, 3}, {5, 5, 5}).has_value());
    EXPECT_FALSE(pearson_correlation({1}, {1}).has_value());
    EXPECT_THROW(pearson_correlation({1, 2}, {1}), logic_error);
}
