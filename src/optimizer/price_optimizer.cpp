/// @file src/optimizer/price_optimizer.cpp
/// @brief Curve argmax, revenue impact, scenarios and confidence.

#include "prism/optimizer.hpp"

#include "../core/diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace prism::optimizer {

namespace {

double round_cents(double x) noexcept {
    return std::round(x * 100.0) / 100.0;
}

/// Power-law demand at `price`, anchored at `avg_demand` for `current`.
/// Power-law demand at `price`; a price that rounds to zero sells nothing.
double demand_at(double price, double current, double coefficient, double avg_demand) noexcept {
    if (current <= 0.0) {
        return avg_demand;
    }
    if (!(price > 0.0)) {
        return 0.0;
    }
    return std::max(0.0, avg_demand * std::pow(price / current, coefficient));
}

double pct_change(double now, double base) noexcept {
    return base > 0.0 ? (now - base) / base * 100.0 : 0.0;
}

struct ScenarioSpec {
    const char* name;
    Risk        risk;
};

constexpr std::array<ScenarioSpec, 4> kScenarioSpecs{{
    {"Aggressive Growth", Risk::Low},
    {"Balanced Optimal", Risk::Low},
    {"Premium Push", Risk::Medium},
    {"Market Penetration", Risk::High},
}};

}  // namespace

const char* to_string(Risk r) noexcept {
    switch (r) {
        case Risk::Low:    return "low";
        case Risk::Medium: return "medium";
        case Risk::High:   return "high";
    }
    return "low";
}

// ─── Formatting ───────────────────────────────────────────────────────────────

std::string PriceOptimizer::format_money_delta(double amount) {
    return fmt::format("{}${:.0f}K", amount >= 0.0 ? "+" : "-", std::abs(amount / 1000.0));
}

std::string PriceOptimizer::format_pct_delta(double pct) {
    return fmt::format("{}{:.1f}%", pct >= 0.0 ? "+" : "", pct);
}

// ─── Construction ─────────────────────────────────────────────────────────────

PriceOptimizer::PriceOptimizer(AnalyticsConfig config)
    : config_(std::move(config)) {}

// ─── find_optimal ─────────────────────────────────────────────────────────────

OptimalPoint PriceOptimizer::find_optimal(std::span<const elasticity::CurvePoint> curve,
                                          double current_price) noexcept {
    if (curve.empty()) {
        return OptimalPoint{current_price, 0.0, 0.0};
    }
    // max_element keeps the first of equal maxima.
    const auto best = std::max_element(
        curve.begin(), curve.end(),
        [](const auto& a, const auto& b) { return a.revenue < b.revenue; });
    return OptimalPoint{best->price, best->demand, best->revenue};
}

// ─── confidence ───────────────────────────────────────────────────────────────

double PriceOptimizer::confidence(double r2, std::size_t data_points) noexcept {
    const double data_confidence =
        std::min(1.0, static_cast<double>(data_points) /
                          static_cast<double>(constants::FULL_CONFIDENCE_POINTS));
    return std::clamp(r2 * 0.5 + data_confidence * 0.5,
                      constants::MIN_OPT_CONFIDENCE, constants::MAX_OPT_CONFIDENCE);
}

// ─── scenarios ────────────────────────────────────────────────────────────────

std::array<Scenario, 4> PriceOptimizer::scenarios(double current_price,
                                                  double optimal_price,
                                                  double coefficient,
                                                  double avg_demand) {
    const std::array<double, 4> prices{
        round_cents(current_price * 0.90),
        optimal_price,
        round_cents(current_price * 1.30),
        round_cents(current_price * 0.80),
    };

    const double current_revenue =
        current_price * demand_at(current_price, current_price, coefficient, avg_demand);

    std::array<Scenario, 4> out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        const double p = prices[i];
        const double d = demand_at(p, current_price, coefficient, avg_demand);

        Scenario& s        = out[i];
        s.id               = static_cast<int>(i) + 1;
        s.name             = kScenarioSpecs[i].name;
        s.risk             = kScenarioSpecs[i].risk;
        s.price            = p;
        s.revenue_delta    = p * d - current_revenue;
        s.demand_delta_pct = pct_change(d, avg_demand);
        s.margin_delta_pct = pct_change(p, current_price);
        s.revenue          = format_money_delta(s.revenue_delta);
        s.demand           = format_pct_delta(s.demand_delta_pct);
        s.margin           = format_pct_delta(s.margin_delta_pct);
    }
    return out;
}

// ─── optimize ─────────────────────────────────────────────────────────────────

Outcome<OptimizationResult>
PriceOptimizer::optimize(std::string product_id,
                         const MarketInputs& market,
                         const Outcome<elasticity::ElasticityResult>& elasticity) const {
    const auto& fit     = elasticity.value;
    const double current = market.current_price;
    const double avg     = market.avg_demand;

    OptimizationResult r;
    r.product_id    = std::move(product_id);
    r.current_price = current;

    const OptimalPoint best = find_optimal(fit.curve, current);
    r.optimal_price   = best.price;
    r.optimal_demand  = best.demand;
    r.optimal_revenue = best.revenue;

    const double current_daily = current * avg;
    const double optimal_daily = best.demand > 0.0 ? best.price * best.demand : best.price * avg;

    r.monthly_impact     = (optimal_daily - current_daily) * constants::DAYS_PER_MONTH;
    r.revenue_impact_pct = pct_change(optimal_daily, current_daily);
    r.margin_improvement_pct = pct_change(best.price, current);
    if (current > 0.0 && avg > 0.0) {
        r.demand_change_pct =
            pct_change(demand_at(best.price, current, fit.coefficient, avg), avg);
    }

    r.revenue_impact      = format_money_delta(r.monthly_impact);
    r.revenue_impact_text = format_pct_delta(r.revenue_impact_pct);
    r.demand_change       = format_pct_delta(r.demand_change_pct);
    r.margin_improvement  = format_pct_delta(r.margin_improvement_pct);

    r.competitor_avg = market.competitor_avg.has_value() && *market.competitor_avg > 0.0
        ? *market.competitor_avg
        : current * constants::MISSING_COMPETITOR_MARKUP;
    r.confidence = confidence(fit.r2, fit.data_points);
    r.scenarios  = scenarios(current, best.price, fit.coefficient, avg);
    r.elasticity = fit;

    detail::trace(config_.verbose, "optimizer",
                  "{}: optimal={:.2f}, confidence={:.0f}%, impact={}",
                  r.product_id, r.optimal_price, r.confidence * 100.0, r.revenue_impact);

    return Outcome<OptimizationResult>{std::move(r), elasticity.quality, elasticity.reason};
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string OptimizationResult::to_string() const {
    std::string out = fmt::format(
        "Optimization for {}: current {:.2f} -> optimal {:.2f} (competitor avg {:.2f})\n"
        "  impact {} / month ({}), demand {}, margin {}, confidence {:.1f}%\n",
        product_id, current_price, optimal_price, competitor_avg,
        revenue_impact, revenue_impact_text, demand_change, margin_improvement,
        confidence * 100.0);
    for (const auto& s : scenarios) {
        out += fmt::format("  [{}] {:<18} {:9.2f}  revenue {:>6}  demand {:>7}  margin {:>7}  risk {}\n",
                           s.id, s.name, s.price, s.revenue, s.demand, s.margin,
                           optimizer::to_string(s.risk));
    }
    return out;
}

}  // namespace prism::optimizer
