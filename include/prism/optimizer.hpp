#pragma once

/// @file include/prism/optimizer.hpp
/// @brief Price Optimizer - revenue-maximizing price and pricing scenarios.
///
/// # Module: Price Optimizer
///
/// ## Responsibility
/// Pick the maximum-revenue sample of an elasticity curve as the optimal
/// price, project the monthly revenue impact of moving there, and compare
/// four fixed pricing scenarios against the current price.
///
/// ## Demand Model
///   demand(p)  = avg_demand · (p / current_price)^ε
///   revenue(p) = p · demand(p)
///
/// Monthly figures are daily figures × 30.
///
/// ## Guarantees
/// - Never throws; an empty curve leaves the optimal price at the current one
/// - `optimal_revenue` equals the maximum revenue on the curve
/// - Confidence ∈ [0.5, 0.98]
/// - Stateless; `optimize` is const and safe to call concurrently

#include "prism/config.hpp"
#include "prism/elasticity.hpp"
#include "prism/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>

namespace prism::optimizer {

enum class Risk { Low, Medium, High };

[[nodiscard]] const char* to_string(Risk r) noexcept;

// ─── Scenario ─────────────────────────────────────────────────────────────────

/// One priced what-if, compared against the current price.
struct Scenario {
    int         id   = 0;
    std::string name;
    double      price = 0.0;
    Risk        risk  = Risk::Low;

    double revenue_delta    = 0.0;  ///< Daily revenue change vs current
    double demand_delta_pct = 0.0;
    double margin_delta_pct = 0.0;

    std::string revenue;  ///< e.g. "+$3K"
    std::string demand;   ///< e.g. "-12.4%"
    std::string margin;   ///< e.g. "+30.0%"
};

// ─── Inputs / Result ──────────────────────────────────────────────────────────

/// Market context the optimizer prices against.
struct MarketInputs {
    double                current_price = constants::FALLBACK_REFERENCE_PRICE;
    std::optional<double> competitor_avg;  ///< Mean of recent competitor quotes
    double                avg_demand = constants::FALLBACK_AVERAGE_DEMAND;
};

/// The best point on a curve.
struct OptimalPoint {
    double price   = 0.0;
    double demand  = 0.0;
    double revenue = 0.0;
};

struct OptimizationResult {
    std::string product_id;
    double      current_price   = 0.0;
    double      optimal_price   = 0.0;
    double      optimal_demand  = 0.0;
    double      optimal_revenue = 0.0;  ///< Curve revenue at the optimal sample
    double      competitor_avg  = 0.0;  ///< current·1.05 when no quotes exist
    double      confidence      = 0.0;

    double monthly_impact         = 0.0;
    double revenue_impact_pct     = 0.0;
    double demand_change_pct      = 0.0;
    double margin_improvement_pct = 0.0;

    std::string revenue_impact;      ///< e.g. "+$12K"
    std::string revenue_impact_text; ///< e.g. "+8.3%"
    std::string demand_change;
    std::string margin_improvement;

    std::array<Scenario, 4>      scenarios{};
    elasticity::ElasticityResult elasticity;

    [[nodiscard]] std::string to_string() const;
};

// ─── PriceOptimizer ───────────────────────────────────────────────────────────

class PriceOptimizer {
public:
    explicit PriceOptimizer(AnalyticsConfig config = AnalyticsConfig{});

    /// Optimize one product's price given its elasticity estimate.
    ///
    /// The returned quality is the elasticity estimate's quality.
    [[nodiscard]] Outcome<OptimizationResult>
    optimize(std::string product_id,
             const MarketInputs& market,
             const Outcome<elasticity::ElasticityResult>& elasticity) const;

    /// First maximum-revenue sample; the current price with zero demand and
    /// revenue when the curve is empty.
    [[nodiscard]] static OptimalPoint
    find_optimal(std::span<const elasticity::CurvePoint> curve, double current_price) noexcept;

    /// The four scenarios: Aggressive Growth (−10%), Balanced Optimal,
    /// Premium Push (+30%), Market Penetration (−20%).
    [[nodiscard]] static std::array<Scenario, 4>
    scenarios(double current_price, double optimal_price, double coefficient, double avg_demand);

    /// clamp(0.5, 0.98, r²·0.5 + min(1, n/50)·0.5)
    [[nodiscard]] static double confidence(double r2, std::size_t data_points) noexcept;

    /// "+$12K" / "-$3K": thousands, rounded, sign kept.
    [[nodiscard]] static std::string format_money_delta(double amount);

    /// "+8.3%" / "-2.0%".
    [[nodiscard]] static std::string format_pct_delta(double pct);

private:
    AnalyticsConfig config_;
};

}  // namespace prism::optimizer
