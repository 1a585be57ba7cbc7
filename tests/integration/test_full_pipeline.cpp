/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the full PRISM pipeline.
///
/// These tests exercise the complete path:
///   rows → SignalEngine → DemandForecaster + ElasticityEstimator →
///   PriceOptimizer → DecisionEngine

#include "prism/data_loader.hpp"
#include "prism/engine.hpp"
#include "prism/simulator.hpp"

#include "fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace prism;
using namespace prism::core;
using prism::testing::day;
using prism::testing::flat;

namespace {

const Date      kFirstDay = day(2024, 1, 2);
const Timestamp kAsOf     = to_timestamp(day(2024, 4, 1));

/// Reference price 100 against a flat market: 90 days of 50 units at 100.
InMemorySource flat_market() {
    InMemorySource src;
    src.set_series("flat", SeriesKind::UnitsSold, flat(kFirstDay, 90, 50.0));
    src.set_series("flat", SeriesKind::CompetitorPrice, flat(kFirstDay, 90, 100.0));
    src.set_reference_price("flat", 100.0);
    return src;
}

}  // namespace

// ─── Flat market ──────────────────────────────────────────────────────────────

TEST(PipelineFlatMarket, HoldsWithFullAuditLog) {
    const auto src = flat_market();
    const Engine engine(src, AnalyticsConfig{}, kAsOf);
    const auto report = engine.analyze("flat");

    EXPECT_DOUBLE_EQ(report.signals.pricing.price_position_index, 1.0);
    EXPECT_EQ(report.signals.pricing.price_volatility, stats::Level::Low);
    EXPECT_NEAR(report.signals.demand.demand_growth_rate, 0.0, 1e-12);

    const auto& decision = *report.decision;
    ASSERT_EQ(decision.recommendations.size(), 1u);
    EXPECT_EQ(decision.recommendations.front().type, decision::ActionType::Hold);
    EXPECT_EQ(decision.recommendations.front().confidence, 92);
    ASSERT_EQ(decision.log.size(), 6u);
    for (const auto& entry : decision.log) {
        EXPECT_FALSE(entry.fired);
    }
}

TEST(PipelineFlatMarket, ForecastIsFlat) {
    const auto src = flat_market();
    const Engine engine(src, AnalyticsConfig{}, kAsOf);
    const auto f = engine.forecast("flat", 14);

    ASSERT_TRUE(f.is_ok());
    ASSERT_EQ(f->predictions.size(), 14u);
    for (const auto& p : f->predictions) {
        // Neutral trend score: 50 · 1.05
        EXPECT_NEAR(p.point_estimate, 52.5, 1e-9);
    }
    EXPECT_TRUE(f->spike_periods.empty());
}

// ─── Overpriced product ───────────────────────────────────────────────────────

TEST(PipelineOverpriced, UndercutRuleFires) {
    InMemorySource src;
    src.set_series("premium", SeriesKind::UnitsSold, flat(kFirstDay, 90, 50.0));
    src.set_series("premium", SeriesKind::CompetitorPrice, flat(kFirstDay, 90, 120.0));
    src.set_reference_price("premium", 150.0);

    const Engine engine(src, AnalyticsConfig{}, kAsOf);
    const auto report = engine.analyze("premium");

    EXPECT_NEAR(report.signals.pricing.price_position_index, 1.25, 1e-12);

    const auto& recs = report.decision->recommendations;
    const auto undercut = std::find_if(recs.begin(), recs.end(), [](const auto& r) {
        return r.rule == decision::RuleId::CompetitorUndercut;
    });
    ASSERT_NE(undercut, recs.end());
    EXPECT_EQ(undercut->type, decision::ActionType::Decrease);
    EXPECT_EQ(undercut->impact, "-25%");
    EXPECT_GE(undercut->confidence, 70);
    EXPECT_TRUE(report.decision->log.front().fired);
}

// ─── Missing sales ────────────────────────────────────────────────────────────

TEST(PipelineNoSales, ForecastReportsInsufficientData) {
    InMemorySource src;
    src.set_series("new", SeriesKind::CompetitorPrice, flat(kFirstDay, 30, 80.0));
    src.set_reference_price("new", 80.0);

    const Engine engine(src, AnalyticsConfig{}, kAsOf);
    const auto report = engine.analyze("new");

    EXPECT_TRUE(report.forecast.is_empty());
    EXPECT_TRUE(report.forecast->predictions.empty());
    EXPECT_DOUBLE_EQ(report.forecast->confidence, 0.0);
    EXPECT_EQ(report.forecast->metrics.error, "insufficient_data");

    EXPECT_TRUE(report.elasticity.is_degraded());
    EXPECT_DOUBLE_EQ(report.elasticity->coefficient, -1.2);
    EXPECT_DOUBLE_EQ(report.optimization->optimal_price, 80.0);
}

// ─── CSV to decision ──────────────────────────────────────────────────────────

TEST(PipelineCsv, LoadedRowsFlowThroughEveryStage) {
    std::string csv = "product_id,kind,timestamp,value\n"
                      "lamp,reference_price,2024-03-31,40\n";
    for (int i = 0; i < 60; ++i) {
        const std::string date = format_date(kFirstDay + std::chrono::days{30 + i});
        csv += "lamp,competitor_price," + date + ",50\n";
        csv += "lamp,units_sold," + date + ",20\n";
        csv += "lamp,trend_score," + date + ",55\n";
    }
    const auto src = DataLoader::parse_csv_string(csv);
    const Engine engine(src, AnalyticsConfig{}, kAsOf);
    const auto report = engine.analyze("lamp");

    EXPECT_DOUBLE_EQ(report.reference_price, 40.0);
    EXPECT_NEAR(report.signals.pricing.price_position_index, 0.8, 1e-12);
    EXPECT_FALSE(report.forecast->predictions.empty());

    const auto& recs = report.decision->recommendations;
    ASSERT_FALSE(recs.empty());
    EXPECT_TRUE(recs.front().rule == decision::RuleId::MarginFloor);
    EXPECT_EQ(recs.front().urgency, decision::Urgency::Critical);
}

// ─── Simulated catalogue ──────────────────────────────────────────────────────

TEST(PipelineSimulated, InvariantsHoldOnSimulatedHistory) {
    SalesSimulator sim(11);
    const ProductProfile profile{.product_id = "sim", .base_price = 60.0,
                                 .base_demand = 30.0, .days = 180, .elasticity = -1.4};
    const auto history = sim.generate(profile, day(2024, 3, 31));

    InMemorySource src;
    src.set_series("sim", SeriesKind::UnitsSold, history.sales);
    src.set_series("sim", SeriesKind::CompetitorPrice, history.prices);
    src.set_reference_price("sim", 60.0);

    const Engine engine(src, AnalyticsConfig{}, kAsOf);
    const auto report = engine.analyze("sim", 30);

    ASSERT_EQ(report.forecast->predictions.size(), 30u);
    for (const auto& p : report.forecast->predictions) {
        EXPECT_GE(p.lower_bound, 0.0);
        EXPECT_LE(p.lower_bound, p.point_estimate);
        EXPECT_LE(p.point_estimate, p.upper_bound);
    }

    EXPECT_EQ(report.elasticity->pairing, elasticity::PairingMode::DateMatched);
    ASSERT_EQ(report.elasticity->curve.size(), 19u);
    double best = 0.0;
    for (const auto& c : report.elasticity->curve) {
        best = std::max(best, c.revenue);
    }
    EXPECT_DOUBLE_EQ(report.optimization->optimal_revenue, best);
    EXPECT_GE(report.optimization->confidence, 0.5);
    EXPECT_LE(report.optimization->confidence, 0.98);

    EXPECT_EQ(report.decision->log.size(), 6u);
    EXPECT_FALSE(report.decision->recommendations.empty());
}
