/// @file tests/signals/test_portfolio.cpp
/// @brief Tests for summarize_portfolio.

#include "prism/signals.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace prism;
using namespace prism::signals;

namespace {

SignalSet make_set(double price, double ma, double growth, double position,
                   double momentum, stats::Level volatility) {
    SignalSet s;
    s.reference_price                  = price;
    s.demand.moving_avg_demand         = ma;
    s.demand.demand_growth_rate        = growth;
    s.demand.quality                   = Quality::Ok;
    s.pricing.price_position_index     = position;
    s.pricing.price_volatility         = volatility;
    s.pricing.quality                  = Quality::Ok;
    s.trend.trend_momentum             = momentum;
    s.trend.quality                    = Quality::Ok;
    s.elasticity.quality               = Quality::Ok;
    return s;
}

}  // namespace

TEST(Portfolio, EmptyInputIsEmptyWithNeutralValues) {
    const auto kpis = summarize_portfolio({});
    EXPECT_TRUE(kpis.is_empty());
    EXPECT_EQ(kpis->total_products, 0u);
    EXPECT_DOUBLE_EQ(kpis->avg_price_position, 1.0);
    EXPECT_DOUBLE_EQ(kpis->est_daily_revenue, 0.0);
}

TEST(Portfolio, AveragesAndRevenue) {
    const std::vector<SignalSet> sets{
        make_set(10.0, 20.0, 0.10, 1.2, 4.0, stats::Level::Low),
        make_set(5.0, 40.0, -0.30, 0.8, -2.0, stats::Level::High),
    };
    const auto kpis = summarize_portfolio(sets);
    ASSERT_TRUE(kpis.is_ok());
    EXPECT_EQ(kpis->total_products, 2u);
    EXPECT_NEAR(kpis->avg_demand_growth, -0.10, 1e-12);
    EXPECT_NEAR(kpis->avg_price_position, 1.0, 1e-12);
    EXPECT_NEAR(kpis->avg_trend_momentum, 1.0, 1e-12);
    EXPECT_NEAR(kpis->est_daily_revenue, 400.0, 1e-9);
    EXPECT_NEAR(kpis->est_monthly_revenue, 12000.0, 1e-9);
    EXPECT_EQ(kpis->volatility_low, 1u);
    EXPECT_EQ(kpis->volatility_medium, 0u);
    EXPECT_EQ(kpis->volatility_high, 1u);
}

TEST(Portfolio, ProductsWithoutDemandCountOneUnitPerDay) {
    const std::vector<SignalSet> sets{make_set(25.0, 0.0, 0.0, 1.0, 0.0, stats::Level::Low)};
    const auto kpis = summarize_portfolio(sets);
    EXPECT_NEAR(kpis->est_daily_revenue, 25.0, 1e-12);
}

TEST(Portfolio, ThinProductDegradesTheSummary) {
    std::vector<SignalSet> sets{make_set(10.0, 5.0, 0.0, 1.0, 0.0, stats::Level::Medium)};
    sets[0].trend.quality = Quality::Degraded;
    const auto kpis = summarize_portfolio(sets);
    EXPECT_TRUE(kpis.is_degraded());
    EXPECT_EQ(kpis->volatility_medium, 1u);
}

TEST(Portfolio, ToStringListsCounts) {
    PortfolioKpis kpis;
    kpis.total_products = 3;
    EXPECT_NE(kpis.to_string().find("3 products"), std::string::npos);
}
