/// @file src/signals/portfolio.cpp
/// @brief Portfolio-level KPIs aggregated over signal sets.

#include "prism/signals.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace prism::signals {

Outcome<PortfolioKpis> summarize_portfolio(std::span<const SignalSet> sets) {
    PortfolioKpis kpis;
    if (sets.empty()) {
        return Outcome<PortfolioKpis>::empty(kpis, "no_data");
    }

    double growth   = 0.0;
    double position = 0.0;
    double momentum = 0.0;
    double revenue  = 0.0;
    bool   degraded = false;

    for (const auto& s : sets) {
        growth   += s.demand.demand_growth_rate;
        position += s.pricing.price_position_index;
        momentum += s.trend.trend_momentum;
        // Products with no recorded demand still count as one unit a day.
        revenue  += s.reference_price * std::max(s.demand.moving_avg_demand, 1.0);

        switch (s.pricing.price_volatility) {
            case stats::Level::Low:    ++kpis.volatility_low;    break;
            case stats::Level::Medium: ++kpis.volatility_medium; break;
            case stats::Level::High:   ++kpis.volatility_high;   break;
        }
        degraded = degraded || s.quality() != Quality::Ok;
    }

    const double n = static_cast<double>(sets.size());
    kpis.total_products      = sets.size();
    kpis.avg_demand_growth   = growth / n;
    kpis.avg_price_position  = position / n;
    kpis.avg_trend_momentum  = momentum / n;
    kpis.est_daily_revenue   = revenue;
    kpis.est_monthly_revenue = revenue * constants::DAYS_PER_MONTH;

    if (degraded) {
        return Outcome<PortfolioKpis>::degraded(kpis, "some products computed on thin data");
    }
    return Outcome<PortfolioKpis>::ok(kpis);
}

std::string PortfolioKpis::to_string() const {
    return fmt::format(
        "Portfolio: {} products  daily≈{:.2f}  monthly≈{:.2f}\n"
        "  avg growth={:.4f}  avg position={:.4f}  avg momentum={:.2f}\n"
        "  volatility low/medium/high = {}/{}/{}\n",
        total_products, est_daily_revenue, est_monthly_revenue,
        avg_demand_growth, avg_price_position, avg_trend_momentum,
        volatility_low, volatility_medium, volatility_high);
}

}  // namespace prism::signals
