/// @file tests/decision/test_decision_engine.cpp
/// @brief Tests for the six pricing rules, hold fallback, ranking and audit log.

#include "prism/decision.hpp"
#include "prism/signals.hpp"

#include "fixtures.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace prism;
using namespace prism::decision;
using prism::signals::SignalSet;

namespace {

/// Neutral signals with every block computed normally.
SignalSet neutral() {
    SignalSet s;
    s.product_id                    = "sku";
    s.reference_price               = 100.0;
    s.pricing.price_position_index  = 1.0;
    s.pricing.quality               = Quality::Ok;
    s.demand.demand_growth_rate     = 0.0;
    s.demand.seasonal_index         = 1.0;
    s.demand.quality                = Quality::Ok;
    s.trend.trend_momentum          = 0.0;
    s.trend.quality                 = Quality::Ok;
    s.elasticity.quality            = Quality::Ok;
    return s;
}

std::vector<RuleId> fired_rules(const Decision& d) {
    std::vector<RuleId> out;
    for (const auto& e : d.log) {
        if (e.fired) out.push_back(e.rule);
    }
    return out;
}

}  // namespace

// ─── Hold ─────────────────────────────────────────────────────────────────────

TEST(DecisionHold, NeutralSignalsHold) {
    DecisionEngine engine;
    const auto out = engine.evaluate(neutral());
    ASSERT_TRUE(out.is_ok());
    ASSERT_EQ(out->recommendations.size(), 1u);

    const auto& r = out->recommendations.front();
    EXPECT_EQ(r.type, ActionType::Hold);
    EXPECT_EQ(r.title, "Maintain current pricing");
    EXPECT_EQ(r.impact, "Stable");
    EXPECT_EQ(r.confidence, 92);
    EXPECT_EQ(r.urgency, Urgency::Low);
    EXPECT_FALSE(r.rule.has_value());
    EXPECT_STREQ(r.source(), "Default Assessment");
    EXPECT_EQ(out->actions_triggered(), 0u);
}

TEST(DecisionHold, AuditLogPassesEveryRule) {
    DecisionEngine engine;
    const auto out = engine.evaluate(neutral());
    ASSERT_EQ(out->log.size(), 6u);
    for (std::size_t i = 0; i < out->log.size(); ++i) {
        EXPECT_EQ(out->log[i].rule, kAllRules[i]);
        EXPECT_FALSE(out->log[i].fired);
        EXPECT_EQ(out->log[i].verdict, "PASS: within threshold");
        EXPECT_FALSE(out->log[i].confidence.has_value());
    }
}

TEST(DecisionHold, ThinSignalsDegradeButStillDecide) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.trend.quality = Quality::Empty;
    const auto out = engine.evaluate(s);
    EXPECT_TRUE(out.is_degraded());
    EXPECT_EQ(out->log.size(), 6u);
    EXPECT_EQ(out->recommendations.size(), 1u);
}

// ─── Individual rules ─────────────────────────────────────────────────────────

TEST(DecisionRules, CompetitorUndercut) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.pricing.price_position_index = 1.25;
    const auto out = engine.evaluate(s);

    ASSERT_EQ(fired_rules(*out), std::vector<RuleId>{RuleId::CompetitorUndercut});
    const auto& r = out->recommendations.front();
    EXPECT_EQ(r.type, ActionType::Decrease);
    EXPECT_EQ(r.title, "Reduce price by 25% to match market");
    EXPECT_EQ(r.impact, "-25%");
    EXPECT_EQ(r.confidence, 95);
    EXPECT_EQ(r.urgency, Urgency::High);
    EXPECT_STREQ(r.source(), "Competitor Undercut Response");

    const auto& entry = out->log.front();
    EXPECT_EQ(entry.input, "position=1.25");
    EXPECT_EQ(entry.verdict, "ACTION: Reduce price by 25% to match market");
    EXPECT_EQ(entry.confidence.value_or(0), 95);
}

TEST(DecisionRules, CompetitorUndercutConfidenceScalesWithGap) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.pricing.price_position_index = 1.125;
    const auto rec = engine.evaluate_rule(RuleId::CompetitorUndercut, s);
    ASSERT_TRUE(rec.has_value());
    // gap 12.5% → 70 + 25
    EXPECT_EQ(rec->confidence, 95);
    s.pricing.price_position_index = 1.11;
    EXPECT_GE(engine.evaluate_rule(RuleId::CompetitorUndercut, s)->confidence, 70);
}

TEST(DecisionRules, ThresholdsAreStrict) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.pricing.price_position_index = 1.10;
    EXPECT_FALSE(engine.evaluate_rule(RuleId::CompetitorUndercut, s).has_value());
    s.pricing.price_position_index = 0.85;
    EXPECT_FALSE(engine.evaluate_rule(RuleId::MarginFloor, s).has_value());
}

TEST(DecisionRules, DemandSurgeCapture) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.demand.demand_growth_rate = 0.2;
    s.trend.trend_momentum      = 12.0;
    const auto rec = engine.evaluate_rule(RuleId::DemandSurgeCapture, s);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->type, ActionType::Increase);
    EXPECT_EQ(rec->title, "Increase price by 6%");
    EXPECT_EQ(rec->impact, "+6%");
    EXPECT_EQ(rec->confidence, 77);
    EXPECT_EQ(rec->urgency, Urgency::High);
    EXPECT_EQ(DecisionEngine::rule_input(RuleId::DemandSurgeCapture, s),
              "growth=0.20, momentum=12");
}

TEST(DecisionRules, DemandSurgeNeedsMomentumToo) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.demand.demand_growth_rate = 0.5;
    s.trend.trend_momentum      = 10.0;
    EXPECT_FALSE(engine.evaluate_rule(RuleId::DemandSurgeCapture, s).has_value());
}

TEST(DecisionRules, LowDemandGuard) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.demand.demand_growth_rate = -0.2;
    const auto rec = engine.evaluate_rule(RuleId::LowDemandGuard, s);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->type, ActionType::Discount);
    EXPECT_EQ(rec->title, "Offer 10% discount");
    EXPECT_EQ(rec->impact, "+20% volume");
    EXPECT_EQ(rec->confidence, 80);
    EXPECT_EQ(rec->urgency, Urgency::Medium);
}

TEST(DecisionRules, LowDemandDiscountIsCapped) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.demand.demand_growth_rate = -0.9;
    const auto rec = engine.evaluate_rule(RuleId::LowDemandGuard, s);
    EXPECT_EQ(rec->title, "Offer 15% discount");
    EXPECT_EQ(rec->confidence, 90);
}

TEST(DecisionRules, SeasonalDiscount) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.demand.seasonal_index     = 0.8;
    s.demand.demand_growth_rate = -0.05;
    const auto out = engine.evaluate(s);
    ASSERT_EQ(fired_rules(*out), std::vector<RuleId>{RuleId::SeasonalDiscount});
    const auto& r = out->recommendations.front();
    EXPECT_EQ(r.title, "Apply seasonal discount (10-15%)");
    EXPECT_EQ(r.impact, "+12% volume");
    EXPECT_EQ(r.confidence, 85);
    EXPECT_EQ(out->log[3].input, "seasonal=0.80");
}

TEST(DecisionRules, SeasonalDiscountNeedsDecliningDemand) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.demand.seasonal_index = 0.5;
    EXPECT_FALSE(engine.evaluate_rule(RuleId::SeasonalDiscount, s).has_value());
}

TEST(DecisionRules, TrendSurgePrep) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.trend.trend_momentum = 20.0;
    const auto rec = engine.evaluate_rule(RuleId::TrendSurgePrep, s);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->type, ActionType::Stock);
    EXPECT_EQ(rec->title, "Prepare for demand surge");
    EXPECT_EQ(rec->confidence, 88);
    EXPECT_EQ(rec->urgency, Urgency::High);
    EXPECT_EQ(DecisionEngine::rule_input(RuleId::TrendSurgePrep, s),
              "momentum=20, growth=0.00");
}

TEST(DecisionRules, MarginFloor) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.pricing.price_position_index = 0.8;
    const auto rec = engine.evaluate_rule(RuleId::MarginFloor, s);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->type, ActionType::Increase);
    EXPECT_EQ(rec->title, "Raise price: 20% below market");
    EXPECT_EQ(rec->impact, "+20% margin");
    EXPECT_EQ(rec->confidence, 97);
    EXPECT_EQ(rec->urgency, Urgency::Critical);
}

TEST(DecisionRules, CustomThresholds) {
    AnalyticsConfig cfg;
    cfg.rules.overpriced_position = 1.3;
    DecisionEngine engine(cfg);
    SignalSet s = neutral();
    s.pricing.price_position_index = 1.25;
    EXPECT_FALSE(engine.evaluate_rule(RuleId::CompetitorUndercut, s).has_value());
}

TEST(DecisionRules, ExtremeUpwardSignalsStayInRange) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.pricing.price_position_index = 1e10;
    s.demand.demand_growth_rate    = 1e10;
    s.trend.trend_momentum         = 1e10;

    const auto undercut = engine.evaluate_rule(RuleId::CompetitorUndercut, s);
    ASSERT_TRUE(undercut.has_value());
    EXPECT_EQ(undercut->confidence, 95);

    const auto surge = engine.evaluate_rule(RuleId::DemandSurgeCapture, s);
    ASSERT_TRUE(surge.has_value());
    EXPECT_EQ(surge->title, "Increase price by 8%");
    EXPECT_EQ(surge->confidence, 95);
}

TEST(DecisionRules, ExtremeDownwardSignalsStayInRange) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.pricing.price_position_index = 0.0;
    s.demand.demand_growth_rate    = -1e10;
    s.demand.seasonal_index        = 0.0;
    s.trend.trend_momentum         = 1e10;

    const auto out = engine.evaluate(s);
    ASSERT_EQ(fired_rules(*out).size(), 4u);
    for (const auto& r : out->recommendations) {
        EXPECT_GE(r.confidence, 0);
        EXPECT_LE(r.confidence, 100);
    }
    const auto guard = engine.evaluate_rule(RuleId::LowDemandGuard, s);
    ASSERT_TRUE(guard.has_value());
    EXPECT_EQ(guard->title, "Offer 15% discount");
    EXPECT_EQ(guard->confidence, 90);
    EXPECT_EQ(engine.evaluate_rule(RuleId::TrendSurgePrep, s)->confidence, 88);
    EXPECT_EQ(engine.evaluate_rule(RuleId::MarginFloor, s)->confidence, 97);
}

TEST(DecisionRules, NearZeroCompetitorPriceCapsConfidence) {
    // Position 1e11 from a near-free competitor quote.
    const signals::SignalEngine signal_engine;
    const auto s = signal_engine.compute("sku", 100.0,
                                         prism::testing::flat(prism::testing::day(2024, 1, 1), 10, 1e-9),
                                         {}, {}, Timestamp{});
    const auto out = DecisionEngine{}.evaluate(s);
    ASSERT_FALSE(out->recommendations.empty());
    const auto& top = out->recommendations.front();
    EXPECT_TRUE(top.rule == RuleId::CompetitorUndercut);
    EXPECT_EQ(top.confidence, 95);
}

// ─── Ranking ──────────────────────────────────────────────────────────────────

TEST(DecisionRank, UrgencyThenConfidence) {
    DecisionEngine engine;
    SignalSet s = neutral();
    s.pricing.price_position_index = 0.8;   // margin floor, critical
    s.demand.demand_growth_rate    = -0.2;  // low demand guard, medium
    s.trend.trend_momentum         = 20.0;  // trend surge prep, high
    const auto out = engine.evaluate(s);

    ASSERT_EQ(out->recommendations.size(), 3u);
    EXPECT_TRUE(out->recommendations[0].rule == RuleId::MarginFloor);
    EXPECT_TRUE(out->recommendations[1].rule == RuleId::TrendSurgePrep);
    EXPECT_TRUE(out->recommendations[2].rule == RuleId::LowDemandGuard);
    EXPECT_EQ(out->actions_triggered(), 3u);

    // The audit log stays in rule order.
    ASSERT_EQ(out->log.size(), 6u);
    EXPECT_EQ(out->log[0].rule, RuleId::CompetitorUndercut);
    EXPECT_EQ(out->log[5].rule, RuleId::MarginFloor);
}

TEST(DecisionRank, TiesKeepInsertionOrder) {
    std::vector<Recommendation> recs(3);
    recs[0].title = "a"; recs[0].urgency = Urgency::High; recs[0].confidence = 80;
    recs[1].title = "b"; recs[1].urgency = Urgency::High; recs[1].confidence = 90;
    recs[2].title = "c"; recs[2].urgency = Urgency::High; recs[2].confidence = 80;
    DecisionEngine::rank(recs);
    EXPECT_EQ(recs[0].title, "b");
    EXPECT_EQ(recs[1].title, "a");
    EXPECT_EQ(recs[2].title, "c");
}

// ─── Names ────────────────────────────────────────────────────────────────────

TEST(DecisionNames, RuleTable) {
    EXPECT_STREQ(rule_info(RuleId::CompetitorUndercut).name, "Competitor Undercut Response");
    EXPECT_STREQ(rule_info(RuleId::MarginFloor).name, "Margin Floor Protection");
    EXPECT_EQ(rule_info(RuleId::MarginFloor).priority, Priority::Critical);
    EXPECT_STREQ(to_string(Urgency::Critical), "Critical");
    EXPECT_STREQ(to_string(ActionType::Stock), "stock");
}

TEST(DecisionToString, IncludesAuditLog) {
    DecisionEngine engine;
    const auto text = engine.evaluate(neutral())->to_string();
    EXPECT_NE(text.find("Audit log"), std::string::npos);
    EXPECT_NE(text.find("Margin Floor Protection"), std::string::npos);
}
