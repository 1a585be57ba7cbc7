/// @file src/elasticity/elasticity_estimator.cpp
/// @brief Pair construction, log-log OLS fit, sensitivity and curve sweep.

#include "prism/elasticity.hpp"
#include "prism/statistics.hpp"

#include "../core/diagnostics.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <span>

namespace prism::elasticity {

namespace {

double round_cents(double x) noexcept {
    return std::round(x * 100.0) / 100.0;
}

}  // namespace

// ─── Enum names ───────────────────────────────────────────────────────────────

const char* to_string(Sensitivity s) noexcept {
    switch (s) {
        case Sensitivity::Low:    return "low";
        case Sensitivity::Medium: return "medium";
        case Sensitivity::High:   return "high";
    }
    return "medium";
}

const char* to_string(PairingMode m) noexcept {
    switch (m) {
        case PairingMode::DateMatched:   return "date_matched";
        case PairingMode::SyntheticRank: return "synthetic_rank";
        case PairingMode::Default:       return "default";
    }
    return "default";
}

// ─── Construction ─────────────────────────────────────────────────────────────

ElasticityEstimator::ElasticityEstimator(AnalyticsConfig config)
    : config_(std::move(config)) {}

// ─── Classification ───────────────────────────────────────────────────────────

Sensitivity ElasticityEstimator::classify(double coefficient) noexcept {
    const double e = std::abs(coefficient);
    if (e > 1.5) return Sensitivity::High;
    if (e > 0.8) return Sensitivity::Medium;
    return Sensitivity::Low;
}

double ElasticityEstimator::band_margin(Sensitivity s) noexcept {
    switch (s) {
        case Sensitivity::High:   return 0.08;
        case Sensitivity::Medium: return 0.12;
        case Sensitivity::Low:    return 0.20;
    }
    return 0.12;
}

ElasticityResult ElasticityEstimator::default_result(double reference_price) {
    ElasticityResult r;
    r.coefficient      = constants::DEFAULT_ELASTICITY;
    r.sensitivity      = Sensitivity::Medium;
    r.r2               = 0.0;
    r.cross_elasticity = constants::DEFAULT_CROSS_ELASTICITY;
    r.data_points      = 0;
    r.reference_price  = reference_price;
    r.optimal_range    = PriceRange{
        round_cents(reference_price * (1.0 - constants::DEFAULT_PRICE_BAND)),
        round_cents(reference_price * (1.0 + constants::DEFAULT_PRICE_BAND)),
    };
    r.pairing = PairingMode::Default;
    return r;
}

// ─── build_pairs ──────────────────────────────────────────────────────────────

std::pair<PricePairs, PairingMode>
ElasticityEstimator::build_pairs(const Series& prices, const Series& sales) {
    // Last sales figure per day; mean competitor price per day.
    std::map<Date, double> demand_by_day;
    for (const auto& o : normalize_series(sales)) {
        demand_by_day[to_date(o.time)] = o.value;
    }

    std::map<Date, std::pair<double, std::size_t>> price_acc;
    for (const auto& o : normalize_series(prices)) {
        auto& [sum, count] = price_acc[to_date(o.time)];
        sum += o.value;
        ++count;
    }
    std::map<Date, double> price_by_day;
    for (const auto& [day, acc] : price_acc) {
        price_by_day[day] = acc.first / static_cast<double>(acc.second);
    }

    PricePairs pairs;
    for (const auto& [day, demand] : demand_by_day) {
        const auto it = price_by_day.find(day);
        if (it != price_by_day.end() && demand > 0.0 && it->second > 0.0) {
            pairs.emplace_back(it->second, demand);
        }
    }

    if (pairs.size() >= constants::ELASTICITY_MIN_MATCHED_PAIRS) {
        return {std::move(pairs), PairingMode::DateMatched};
    }

    // Rank pairing: cheapest day against busiest day, and so on down.
    std::vector<double> ranked_prices;
    ranked_prices.reserve(price_by_day.size());
    for (const auto& [day, p] : price_by_day) {
        ranked_prices.push_back(p);
    }
    std::vector<double> ranked_demand;
    ranked_demand.reserve(demand_by_day.size());
    for (const auto& [day, d] : demand_by_day) {
        ranked_demand.push_back(d);
    }
    std::sort(ranked_prices.begin(), ranked_prices.end());
    std::sort(ranked_demand.begin(), ranked_demand.end(), std::greater<>{});

    PricePairs synthetic;
    const std::size_t n = std::min(ranked_prices.size(), ranked_demand.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (ranked_prices[i] > 0.0 && ranked_demand[i] > 0.0) {
            synthetic.emplace_back(ranked_prices[i], ranked_demand[i]);
        }
    }
    return {std::move(synthetic), PairingMode::SyntheticRank};
}

// ─── curve ────────────────────────────────────────────────────────────────────

std::vector<CurvePoint> ElasticityEstimator::curve(double reference_price,
                                                   double coefficient,
                                                   double intercept) const {
    std::vector<CurvePoint> out;
    const auto& sweep = config_.curve;
    if (sweep.step_pct <= 0 || sweep.max_pct < sweep.min_pct) {
        return out;
    }

    for (int pct = sweep.min_pct; pct <= sweep.max_pct; pct += sweep.step_pct) {
        const double price = round_cents(reference_price * pct / 100.0);
        const double log_demand = price > 0.0 ? intercept + coefficient * std::log(price) : 0.0;
        const double demand = std::max(0.0, std::round(std::exp(log_demand)));
        out.push_back(CurvePoint{
            .price   = price,
            .demand  = demand,
            .revenue = round_cents(price * demand),
        });
    }
    return out;
}

// ─── estimate ─────────────────────────────────────────────────────────────────

Outcome<ElasticityResult> ElasticityEstimator::estimate(double reference_price,
                                                        const Series& prices,
                                                        const Series& sales) const {
    auto [pairs, mode] = build_pairs(prices, sales);

    if (pairs.size() < constants::ELASTICITY_MIN_PAIRS) {
        detail::trace(config_.verbose, "elasticity",
                      "insufficient data for elasticity ({} pairs), using default", pairs.size());
        return Outcome<ElasticityResult>::degraded(default_result(reference_price),
                                                   "insufficient_data");
    }

    const auto n = static_cast<Eigen::Index>(pairs.size());
    Eigen::ArrayXd log_price(n);
    Eigen::ArrayXd log_demand(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        log_price(i)  = pairs[static_cast<std::size_t>(i)].first;
        log_demand(i) = pairs[static_cast<std::size_t>(i)].second;
    }
    log_price  = log_price.log();
    log_demand = log_demand.log();

    const auto fit = stats::ols(
        std::span<const double>(log_price.data(), pairs.size()),
        std::span<const double>(log_demand.data(), pairs.size()));

    ElasticityResult r;
    r.coefficient      = fit.slope;
    r.intercept        = fit.intercept;
    r.r2               = fit.r2;
    r.data_points      = fit.n;
    r.sensitivity      = classify(fit.slope);
    r.cross_elasticity = constants::CROSS_ELASTICITY_FACTOR * std::abs(fit.slope);
    r.reference_price  = reference_price;
    r.pairing          = mode;

    const double margin = band_margin(r.sensitivity);
    r.optimal_range = PriceRange{
        round_cents(reference_price * (1.0 - margin)),
        round_cents(reference_price * (1.0 + margin)),
    };
    r.curve = curve(reference_price, fit.slope, fit.intercept);

    detail::trace(config_.verbose, "elasticity",
                  "e={:.4f}, sensitivity={}, r2={:.4f}, optimal=[{:.2f}, {:.2f}], pairing={}",
                  r.coefficient, to_string(r.sensitivity), r.r2,
                  r.optimal_range.min, r.optimal_range.max, to_string(mode));

    if (mode == PairingMode::SyntheticRank) {
        return Outcome<ElasticityResult>::degraded(std::move(r), "synthetic_pairing");
    }
    return Outcome<ElasticityResult>::ok(std::move(r));
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string ElasticityResult::to_string() const {
    std::string out = fmt::format(
        "Elasticity e={:.4f} ({} sensitivity), r2={:.4f}, cross={:.4f}, n={}, pairing={}\n"
        "  optimal range: {:.2f} .. {:.2f}\n",
        coefficient, elasticity::to_string(sensitivity), r2, cross_elasticity,
        data_points, elasticity::to_string(pairing), optimal_range.min, optimal_range.max);
    for (const auto& p : curve) {
        out += fmt::format("  {:10.2f}  {:8.0f}  {:12.2f}\n", p.price, p.demand, p.revenue);
    }
    return out;
}

}  // namespace prism::elasticity
