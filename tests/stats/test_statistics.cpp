/// @file tests/stats/test_statistics.cpp
/// @brief Tests for the statistics kernel.

#include "prism/statistics.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using namespace prism::stats;

// ─── mean / population_std ────────────────────────────────────────────────────

TEST(StatsMean, EmptyIsZero) {
    EXPECT_DOUBLE_EQ(mean({}), 0.0);
}

TEST(StatsMean, SimpleAverage) {
    const std::vector<double> v{1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(mean(v), 2.5);
}

TEST(StatsPopulationStd, FewerThanTwoPointsIsZero) {
    EXPECT_DOUBLE_EQ(population_std({}), 0.0);
    const std::vector<double> one{42.0};
    EXPECT_DOUBLE_EQ(population_std(one), 0.0);
}

TEST(StatsPopulationStd, DividesByN) {
    // mean 5, squared deviations sum 32, n = 8 → σ = 2
    const std::vector<double> v{2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_NEAR(population_std(v), 2.0, 1e-12);
}

TEST(StatsPopulationStd, ConstantSeriesIsZero) {
    const std::vector<double> v(10, 3.5);
    EXPECT_NEAR(population_std(v), 0.0, 1e-12);
}

// ─── ols ──────────────────────────────────────────────────────────────────────

TEST(StatsOls, ExactLineHasUnitR2) {
    const std::vector<double> x{1, 2, 3, 4, 5};
    const std::vector<double> y{3, 5, 7, 9, 11};  // y = 1 + 2x
    const auto fit = ols(x, y);
    EXPECT_NEAR(fit.slope, 2.0, 1e-12);
    EXPECT_NEAR(fit.intercept, 1.0, 1e-12);
    EXPECT_NEAR(fit.r2, 1.0, 1e-12);
    EXPECT_EQ(fit.n, 5u);
}

TEST(StatsOls, NegativeSlope) {
    const std::vector<double> x{0, 1, 2, 3};
    const std::vector<double> y{10, 8, 6, 4};
    const auto fit = ols(x, y);
    EXPECT_NEAR(fit.slope, -2.0, 1e-12);
    EXPECT_NEAR(fit.intercept, 10.0, 1e-12);
}

TEST(StatsOls, NoisyFitHasR2BetweenZeroAndOne) {
    const std::vector<double> x{1, 2, 3, 4, 5, 6};
    const std::vector<double> y{2.1, 3.9, 6.2, 7.8, 10.3, 11.7};
    const auto fit = ols(x, y);
    EXPECT_GT(fit.r2, 0.9);
    EXPECT_LT(fit.r2, 1.0);
}

TEST(StatsOls, FewerThanThreePointsSoftFails) {
    const std::vector<double> x{1, 2};
    const std::vector<double> y{5, 7};
    const auto fit = ols(x, y);
    EXPECT_DOUBLE_EQ(fit.slope, 0.0);
    EXPECT_DOUBLE_EQ(fit.r2, 0.0);
    EXPECT_DOUBLE_EQ(fit.intercept, 6.0);
}

TEST(StatsOls, ConstantXSoftFails) {
    const std::vector<double> x(6, 4.0);
    const std::vector<double> y{1, 2, 3, 4, 5, 6};
    const auto fit = ols(x, y);
    EXPECT_DOUBLE_EQ(fit.slope, 0.0);
    EXPECT_DOUBLE_EQ(fit.r2, 0.0);
    EXPECT_NEAR(fit.intercept, 3.5, 1e-12);
}

TEST(StatsOls, MismatchedLengthsSoftFail) {
    const std::vector<double> x{1, 2, 3, 4};
    const std::vector<double> y{1, 2, 3};
    const auto fit = ols(x, y);
    EXPECT_DOUBLE_EQ(fit.slope, 0.0);
    EXPECT_DOUBLE_EQ(fit.r2, 0.0);
}

TEST(StatsOls, ConstantYGivesZeroR2) {
    const std::vector<double> x{1, 2, 3, 4};
    const std::vector<double> y(4, 7.0);
    const auto fit = ols(x, y);
    EXPECT_NEAR(fit.slope, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(fit.r2, 0.0);
}

// ─── classify_level ───────────────────────────────────────────────────────────

TEST(StatsClassifyLevel, BoundariesAreInclusive) {
    EXPECT_EQ(classify_level(0.05, 0.05, 0.15), Level::Low);
    EXPECT_EQ(classify_level(0.10, 0.05, 0.15), Level::Medium);
    EXPECT_EQ(classify_level(0.15, 0.05, 0.15), Level::Medium);
    EXPECT_EQ(classify_level(0.16, 0.05, 0.15), Level::High);
}

TEST(StatsClassifyLevel, Names) {
    EXPECT_STREQ(to_string(Level::Low), "low");
    EXPECT_STREQ(to_string(Level::Medium), "medium");
    EXPECT_STREQ(to_string(Level::High), "high");
}

// ─── zscore_correlation ───────────────────────────────────────────────────────

TEST(StatsZscoreCorrelation, PerfectlyAlignedIsOne) {
    const std::vector<double> x{1, 2, 3, 4, 5};
    const std::vector<double> y{10, 20, 30, 40, 50};
    EXPECT_NEAR(zscore_correlation(x, y), 1.0, 1e-12);
}

TEST(StatsZscoreCorrelation, OpposedIsMinusOne) {
    const std::vector<double> x{1, 2, 3, 4, 5};
    const std::vector<double> y{5, 4, 3, 2, 1};
    EXPECT_NEAR(zscore_correlation(x, y), -1.0, 1e-12);
}

TEST(StatsZscoreCorrelation, ZeroVarianceIsZero) {
    const std::vector<double> x{1, 2, 3};
    const std::vector<double> y(3, 2.0);
    EXPECT_DOUBLE_EQ(zscore_correlation(x, y), 0.0);
}

TEST(StatsZscoreCorrelation, EmptyIsZero) {
    const std::vector<double> x{1, 2, 3};
    EXPECT_DOUBLE_EQ(zscore_correlation(x, {}), 0.0);
}

TEST(StatsZscoreCorrelation, IsFiniteForUnequalLengths) {
    const std::vector<double> x{1, 2, 3, 4, 5, 6, 7};
    const std::vector<double> y{3, 1, 4};
    EXPECT_TRUE(std::isfinite(zscore_correlation(x, y)));
}
