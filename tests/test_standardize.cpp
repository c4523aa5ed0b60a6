// test_standardize.cpp: per-column z-scores with the sample (n-1) deviation.

#include <gtest/gtest.h>

#include "stats/standardize.hpp"

#include <cmath>
#include <vector>

using betarank::column;
using betarank::column_status;
using betarank::compute_moments;
using betarank::is_undefined;
using betarank::standardize_column;
using betarank::undefined;

namespace {

struct defined_moments {
    std::size_t n = 0;
    double mean = 0.0;
    double sample_var = 0.0;
};

defined_moments moments_of(const column& v) {
    defined_moments m;
    double sum = 0.0;
    for (double x : v) if (!is_undefined(x)) { ++m.n; sum += x; }
    m.mean = sum / static_cast<double>(m.n);
    double ss = 0.0;
    for (double x : v) if (!is_undefined(x)) ss += (x - m.mean) * (x - m.mean);
    m.sample_var = ss / static_cast<double>(m.n - 1);
    return m;
}

bool all_undefined(const column& v) {
    for (double x : v) if (!is_undefined(x)) return false;
    return true;
}

}  // namespace

TEST(Moments, SampleStddevUsesNMinusOne) {
    const auto m = compute_moments({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    EXPECT_EQ(m.count, 8u);
    EXPECT_DOUBLE_EQ(m.mean, 5.0);
    // population variance 4, sample variance 32/7
    EXPECT_NEAR(m.stddev, std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_EQ(m.status(), column_status::ok);
}

TEST(Moments, IgnoresUndefinedEntries) {
    const auto m = compute_moments({1.0, undefined, 3.0});
    EXPECT_EQ(m.count, 2u);
    EXPECT_DOUBLE_EQ(m.mean, 2.0);
    EXPECT_NEAR(m.stddev, std::sqrt(2.0), 1e-12);
}

TEST(Standardize, DefinedValuesHaveZeroMeanUnitSampleVariance) {
    const column raw = {0.3, 1.7, -0.4, 2.2, 0.9, 1.1, -1.3, 0.05};
    const auto z = standardize_column(raw);
    ASSERT_EQ(z.status, column_status::ok);
    ASSERT_EQ(z.values.size(), raw.size());
    const auto m = moments_of(z.values);
    EXPECT_EQ(m.n, raw.size());
    EXPECT_NEAR(m.mean, 0.0, 1e-12);
    EXPECT_NEAR(m.sample_var, 1.0, 1e-12);
}

TEST(Standardize, KnownThreeValueColumn) {
    // mean 200, sample stddev 100
    const auto z = standardize_column({100.0, 200.0, 300.0});
    ASSERT_EQ(z.status, column_status::ok);
    EXPECT_DOUBLE_EQ(z.values[0], -1.0);
    EXPECT_DOUBLE_EQ(z.values[1],  0.0);
    EXPECT_DOUBLE_EQ(z.values[2],  1.0);
}

TEST(Standardize, ConstantColumnIsDegenerate) {
    const auto z = standardize_column({3.0, 3.0, 3.0, 3.0, 3.0});
    EXPECT_EQ(z.status, column_status::zero_stddev);
    EXPECT_EQ(z.values.size(), 5u);
    EXPECT_TRUE(all_undefined(z.values));
}

TEST(Standardize, OverflowingSpreadIsNotZeroSpread) {
    // squared deviations of 1e200 overflow to inf
    const auto z = standardize_column({1e200, -1e200, 1e200});
    EXPECT_EQ(z.status, column_status::nonfinite_stddev);
    EXPECT_STREQ(betarank::to_string(z.status), "non-finite standard deviation");
    EXPECT_TRUE(all_undefined(z.values));
}

TEST(Standardize, SingleDefinedValueIsDegenerate) {
    const auto z = standardize_column({undefined, 4.2, undefined});
    EXPECT_EQ(z.status, column_status::too_few_values);
    EXPECT_TRUE(all_undefined(z.values));
}

TEST(Standardize, EmptyAndAllMissingColumnsAreDegenerate) {
    EXPECT_EQ(standardize_column({}).status, column_status::too_few_values);
    const auto z = standardize_column({undefined, undefined});
    EXPECT_EQ(z.status, column_status::too_few_values);
    EXPECT_TRUE(all_undefined(z.values));
}

TEST(Standardize, MissingEntryStaysInPlace) {
    const column raw = {1.0, 2.0, undefined, 4.0, 8.0};
    const auto z = standardize_column(raw);
    ASSERT_EQ(z.status, column_status::ok);
    for (std::size_t i = 0; i < raw.size(); ++i) {
        EXPECT_EQ(is_undefined(z.values[i]), i == 2) << "row " << i;
    }
    const auto m = moments_of(z.values);
    EXPECT_EQ(m.n, 4u);
    EXPECT_NEAR(m.mean, 0.0, 1e-12);
    EXPECT_NEAR(m.sample_var, 1.0, 1e-12);
}

TEST(Standardize, DoesNotTouchInput) {
    const column raw = {5.0, 6.0, 7.0};
    const column copy = raw;
    (void)standardize_column(raw);
    EXPECT_EQ(raw, copy);
}
