/// @file src/decision/decision_engine.cpp
/// @brief Rule evaluation, hold fallback, audit log and ranking.

#include "prism/decision.hpp"

#include "../core/diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace prism::decision {

namespace {

constexpr std::array<RuleInfo, 6> kRuleTable{{
    {RuleId::CompetitorUndercut, "Competitor Undercut Response",
     "price_position_index > 1.10", "Match market price", Priority::Critical},
    {RuleId::DemandSurgeCapture, "Demand Surge Capture",
     "demand_growth_rate > 0.15 AND trend_momentum > 10", "Increase price by 3-8%", Priority::High},
    {RuleId::LowDemandGuard, "Low Demand Guard",
     "demand_growth_rate < -0.15", "Offer 5-15% discount", Priority::High},
    {RuleId::SeasonalDiscount, "Seasonal Discount Window",
     "seasonal_index < 0.9 AND demand_growth_rate < 0", "Apply 10-15% discount tier", Priority::Medium},
    {RuleId::TrendSurgePrep, "Trend Surge Preparation",
     "trend_momentum > 15 AND demand_growth_rate < 0.05", "Prepare stock for demand surge", Priority::Medium},
    {RuleId::MarginFloor, "Margin Floor Protection",
     "price_position_index < 0.85", "Raise price toward market", Priority::Critical},
}};

constexpr const char* kHoldSource = "Default Assessment";

double round1(double x) noexcept {
    return std::round(x * 10.0) / 10.0;
}

/// `base` plus the truncated `bonus`, capped at `cap` and floored at 0. The
/// bonus is clamped before the int conversion; signal magnitudes are
/// unbounded.
int bounded_confidence(int base, double bonus, int cap) noexcept {
    if (std::isnan(bonus)) {
        return base;
    }
    const double clamped = std::clamp(bonus, -static_cast<double>(base),
                                      static_cast<double>(cap - base));
    return base + static_cast<int>(clamped);
}

}  // namespace

// ─── Names ────────────────────────────────────────────────────────────────────

const RuleInfo& rule_info(RuleId id) noexcept {
    return kRuleTable[static_cast<std::size_t>(id) - 1];
}

const char* to_string(ActionType t) noexcept {
    switch (t) {
        case ActionType::Increase: return "increase";
        case ActionType::Decrease: return "decrease";
        case ActionType::Discount: return "discount";
        case ActionType::Stock:    return "stock";
        case ActionType::Hold:     return "hold";
    }
    return "hold";
}

const char* to_string(Urgency u) noexcept {
    switch (u) {
        case Urgency::Low:      return "Low";
        case Urgency::Medium:   return "Medium";
        case Urgency::High:     return "High";
        case Urgency::Critical: return "Critical";
    }
    return "Low";
}

const char* to_string(Priority p) noexcept {
    switch (p) {
        case Priority::Medium:   return "medium";
        case Priority::High:     return "high";
        case Priority::Critical: return "critical";
    }
    return "medium";
}

const char* Recommendation::source() const noexcept {
    return rule ? rule_info(*rule).name : kHoldSource;
}

std::size_t Decision::actions_triggered() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        recommendations.begin(), recommendations.end(),
        [](const Recommendation& r) { return r.type != ActionType::Hold; }));
}

// ─── Construction ─────────────────────────────────────────────────────────────

DecisionEngine::DecisionEngine(AnalyticsConfig config)
    : config_(std::move(config)) {}

// ─── rule_input ───────────────────────────────────────────────────────────────

std::string DecisionEngine::rule_input(RuleId id, const signals::SignalSet& s) {
    const double position = s.pricing.price_position_index;
    const double growth   = s.demand.demand_growth_rate;
    const double momentum = s.trend.trend_momentum;

    switch (id) {
        case RuleId::CompetitorUndercut:
        case RuleId::MarginFloor:
            return fmt::format("position={:.2f}", position);
        case RuleId::DemandSurgeCapture:
            return fmt::format("growth={:.2f}, momentum={:.0f}", growth, momentum);
        case RuleId::LowDemandGuard:
            return fmt::format("growth={:.2f}", growth);
        case RuleId::SeasonalDiscount:
            return fmt::format("seasonal={:.2f}", s.demand.seasonal_index);
        case RuleId::TrendSurgePrep:
            return fmt::format("momentum={:.0f}, growth={:.2f}", momentum, growth);
    }
    return "N/A";
}

// ─── evaluate_rule ────────────────────────────────────────────────────────────

std::optional<Recommendation>
DecisionEngine::evaluate_rule(RuleId id, const signals::SignalSet& s) const {
    const auto& t = config_.rules;

    const double position = s.pricing.price_position_index;
    const double growth   = s.demand.demand_growth_rate;
    const double momentum = s.trend.trend_momentum;
    const double seasonal = s.demand.seasonal_index;

    Recommendation r;
    r.rule = id;

    switch (id) {
        case RuleId::CompetitorUndercut: {
            if (!(position > t.overpriced_position)) return std::nullopt;
            const double pct = round1((position - 1.0) * 100.0);
            r.type       = ActionType::Decrease;
            r.title      = fmt::format("Reduce price by {:.0f}% to match market", pct);
            r.rationale  = fmt::format(
                "Your price is {:.1f}% above competitor average. Market volatility is {}. "
                "Adjust to maintain competitiveness.",
                pct, stats::to_string(s.pricing.price_volatility));
            r.impact     = fmt::format("-{:.0f}%", pct);
            r.confidence = bounded_confidence(70, pct * 2.0, 95);
            r.urgency    = Urgency::High;
            r.input      = fmt::format("position_index={:.2f}", position);
            return r;
        }
        case RuleId::DemandSurgeCapture: {
            if (!(growth > t.surge_growth && momentum > t.surge_momentum)) return std::nullopt;
            const int increase = static_cast<int>(std::clamp(growth * 30.0, 3.0, 8.0));
            r.type       = ActionType::Increase;
            r.title      = fmt::format("Increase price by {}%", increase);
            r.rationale  = fmt::format(
                "Demand growing at {:.0f}% with trend momentum of {:.0f}. "
                "Market interest is accelerating, room to capture margin.",
                growth * 100.0, momentum);
            r.impact     = fmt::format("+{}%", increase);
            r.confidence = bounded_confidence(65, momentum, 95);
            r.urgency    = Urgency::High;
            r.input      = fmt::format("growth={:.2f}, momentum={:.0f}", growth, momentum);
            return r;
        }
        case RuleId::LowDemandGuard: {
            if (!(growth < t.slump_growth)) return std::nullopt;
            const double drop    = std::abs(growth);
            const int    discount = static_cast<int>(std::clamp(drop * 50.0, 5.0, 15.0));
            r.type       = ActionType::Discount;
            r.title      = fmt::format("Offer {}% discount", discount);
            r.rationale  = fmt::format(
                "Demand falling at {:.0f}%. A targeted discount could stabilize sales.",
                growth * 100.0);
            r.impact     = fmt::format("+{}% volume", discount * 2);
            r.confidence = bounded_confidence(60, drop * 100.0, 90);
            r.urgency    = Urgency::Medium;
            r.input      = fmt::format("growth={:.2f}", growth);
            return r;
        }
        case RuleId::SeasonalDiscount: {
            if (!(seasonal < t.off_season_index && growth < t.off_season_growth)) return std::nullopt;
            r.type       = ActionType::Discount;
            r.title      = "Apply seasonal discount (10-15%)";
            r.rationale  = fmt::format(
                "Seasonal index at {:.2f} (below normal) and demand is declining. "
                "A seasonal promotion can maintain volume.",
                seasonal);
            r.impact     = "+12% volume";
            r.confidence = bounded_confidence(55, (1.0 - seasonal) * 200.0, 85);
            r.urgency    = Urgency::Medium;
            r.input      = fmt::format("seasonal={:.2f}, growth={:.2f}", seasonal, growth);
            return r;
        }
        case RuleId::TrendSurgePrep: {
            if (!(momentum > t.trend_surge_momentum && growth < t.trend_surge_growth)) return std::nullopt;
            r.type       = ActionType::Stock;
            r.title      = "Prepare for demand surge";
            r.rationale  = fmt::format(
                "Trend momentum at +{:.0f} but demand has not surged yet. Increase stock.",
                momentum);
            r.impact     = "+20-40% demand expected";
            r.confidence = bounded_confidence(60, momentum * 1.5, 88);
            r.urgency    = Urgency::High;
            r.input      = fmt::format("momentum={:.0f}, growth={:.2f}", momentum, growth);
            return r;
        }
        case RuleId::MarginFloor: {
            if (!(position < t.underpriced_position)) return std::nullopt;
            const double pct = round1((1.0 - position) * 100.0);
            r.type       = ActionType::Increase;
            r.title      = fmt::format("Raise price: {:.0f}% below market", pct);
            r.rationale  = fmt::format(
                "Your price is {:.1f}% below competitor average. "
                "This may erode margins without capturing proportional volume.",
                pct);
            r.impact     = fmt::format("+{:.0f}% margin", pct);
            r.confidence = bounded_confidence(80, pct, 97);
            r.urgency    = Urgency::Critical;
            r.input      = fmt::format("position_index={:.2f}", position);
            return r;
        }
    }
    return std::nullopt;
}

// ─── hold / rank ──────────────────────────────────────────────────────────────

Recommendation DecisionEngine::hold() {
    Recommendation r;
    r.type       = ActionType::Hold;
    r.title      = "Maintain current pricing";
    r.rationale  = "All indicators are within normal ranges. No action required at this time.";
    r.impact     = "Stable";
    r.confidence = constants::HOLD_CONFIDENCE;
    r.urgency    = Urgency::Low;
    r.input      = "All signals normal";
    return r;
}

void DecisionEngine::rank(std::vector<Recommendation>& recommendations) {
    std::stable_sort(recommendations.begin(), recommendations.end(),
                     [](const Recommendation& a, const Recommendation& b) {
                         if (a.urgency != b.urgency) {
                             return static_cast<int>(a.urgency) > static_cast<int>(b.urgency);
                         }
                         return a.confidence > b.confidence;
                     });
}

// ─── evaluate ─────────────────────────────────────────────────────────────────

Outcome<Decision> DecisionEngine::evaluate(const signals::SignalSet& signals) const {
    Decision d;
    d.product_id   = signals.product_id;
    d.evaluated_at = signals.evaluated_at;
    d.log.reserve(kAllRules.size());

    for (const RuleId id : kAllRules) {
        LogEntry entry;
        entry.rule  = id;
        entry.input = rule_input(id, signals);

        if (auto rec = evaluate_rule(id, signals)) {
            entry.fired      = true;
            entry.verdict    = "ACTION: " + rec->title;
            entry.confidence = rec->confidence;
            d.recommendations.push_back(std::move(*rec));
        } else {
            entry.verdict = "PASS: within threshold";
        }
        d.log.push_back(std::move(entry));
    }

    if (d.recommendations.empty()) {
        d.recommendations.push_back(hold());
    }
    rank(d.recommendations);

    detail::trace(config_.verbose, "decision", "{}: {} actions from {} rules",
                  d.product_id, d.actions_triggered(), kAllRules.size());

    if (signals.quality() == Quality::Ok) {
        return Outcome<Decision>::ok(std::move(d));
    }
    return Outcome<Decision>::degraded(std::move(d), "signals computed on thin data");
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string Decision::to_string() const {
    std::string out = fmt::format("Decision for {} at {}: {} actions\n",
                                  product_id, format_timestamp(evaluated_at), actions_triggered());
    for (const auto& r : recommendations) {
        out += fmt::format("  [{:<8}] {:<8} {} ({}, confidence {}%)\n      {}\n",
                           decision::to_string(r.urgency), decision::to_string(r.type),
                           r.title, r.impact, r.confidence, r.rationale);
    }
    out += "  Audit log:\n";
    for (const auto& e : log) {
        out += fmt::format("    {:<30} {:<32} {}", rule_info(e.rule).name, e.input, e.verdict);
        if (e.confidence) {
            out += fmt::format(" ({}%)", *e.confidence);
        }
        out += '\n';
    }
    return out;
}

}  // namespace prism::decision
