/// @file src/signals/signal_engine.cpp
/// @brief SignalEngine - pricing, demand, trend and elasticity blocks.
///
/// Every block sanitises its own window and falls back to documented
/// defaults, so a SignalSet is always produced.

#include "prism/signals.hpp"
#include "prism/statistics.hpp"

#include "../core/diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <span>

namespace prism::signals {

namespace {

Direction direction_of(double value, double band) noexcept {
    if (value > band)  return Direction::Rising;
    if (value < -band) return Direction::Falling;
    return Direction::Stable;
}

ElasticityLabel to_elasticity_label(stats::Level level) noexcept {
    switch (level) {
        case stats::Level::Low:    return ElasticityLabel::Low;
        case stats::Level::Medium: return ElasticityLabel::Medium;
        case stats::Level::High:   return ElasticityLabel::High;
    }
    return ElasticityLabel::Unknown;
}

}  // namespace

// ─── Labels ───────────────────────────────────────────────────────────────────

const char* to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Rising:  return "rising";
        case Direction::Falling: return "falling";
        case Direction::Stable:  return "stable";
    }
    return "stable";
}

const char* to_string(ElasticityLabel l) noexcept {
    switch (l) {
        case ElasticityLabel::Unknown: return "unknown";
        case ElasticityLabel::Low:     return "low";
        case ElasticityLabel::Medium:  return "medium";
        case ElasticityLabel::High:    return "high";
    }
    return "unknown";
}

// ─── Construction ─────────────────────────────────────────────────────────────

SignalEngine::SignalEngine(AnalyticsConfig config)
    : config_(std::move(config)) {}

// ─── Pricing block ────────────────────────────────────────────────────────────

PricingSignals SignalEngine::pricing(double reference_price,
                                     const Series& prices) const {
    PricingSignals out;
    const auto window = values_of(most_recent(prices, config_.signals.price_window));
    if (window.empty()) {
        return out;
    }

    const double avg = stats::mean(window);
    const double sd  = stats::population_std(window);
    const double cv  = avg > 0.0 ? sd / avg : 0.0;

    out.competitor_price_avg   = avg;
    out.price_variance         = sd;
    out.price_position_index   = avg > 0.0 ? reference_price / avg : 1.0;
    out.price_volatility_score = cv;
    out.price_volatility       = stats::classify_level(
        cv, config_.signals.volatility_low, config_.signals.volatility_medium);
    out.quality = avg > 0.0 ? Quality::Ok : Quality::Degraded;
    return out;
}

// ─── Demand block ─────────────────────────────────────────────────────────────

DemandSignals SignalEngine::demand(const Series& sales) const {
    DemandSignals out;
    const Series rows = most_recent(sales, config_.signals.demand_window);
    if (rows.empty()) {
        return out;
    }

    const auto units = values_of(rows);
    const std::span<const double> all(units);
    const std::size_t n    = units.size();
    const std::size_t week = config_.signals.moving_average_days;

    // Last week vs. the week before it; short series compare against the
    // first half instead.
    const auto last = all.last(std::min(n, week));
    std::span<const double> prior;
    if (n >= 2 * week) {
        prior = all.subspan(n - 2 * week, week);
    } else {
        prior = all.first(n / 2);
    }

    const double ma      = stats::mean(last);
    const double prev_ma = stats::mean(prior);  // empty prior → 0
    const double growth  = prev_ma > 0.0 ? (ma - prev_ma) / prev_ma : 0.0;

    std::vector<double> weekend;
    std::vector<double> weekday;
    for (const auto& o : rows) {
        (is_weekend(to_date(o.time)) ? weekend : weekday).push_back(o.value);
    }

    double seasonal = 1.0;
    if (!weekday.empty()) {
        const double wd_avg = stats::mean(weekday);
        const double we_avg = weekend.empty() ? wd_avg : stats::mean(weekend);
        seasonal = wd_avg > 0.0 ? we_avg / wd_avg : 1.0;
    }

    out.moving_avg_demand   = ma;
    out.demand_growth_rate  = growth;
    out.demand_growth_label = direction_of(growth, config_.signals.growth_label_band);
    out.seasonal_index      = seasonal;
    out.quality = n >= 2 * week ? Quality::Ok : Quality::Degraded;
    return out;
}

// ─── Trend block ──────────────────────────────────────────────────────────────

TrendSignals SignalEngine::trend(const Series& scores) const {
    TrendSignals out;
    const auto values = values_of(most_recent(scores, config_.signals.trend_window));
    const std::size_t n = values.size();
    if (n < 2) {
        out.quality = n == 0 ? Quality::Empty : Quality::Degraded;
        return out;
    }

    const std::span<const double> all(values);
    const std::size_t mid = n / 2;
    const double momentum = stats::mean(all.subspan(mid)) - stats::mean(all.first(mid));

    double acceleration = 0.0;
    if (n >= 3) {
        std::vector<double> deltas(n - 1);
        for (std::size_t i = 0; i + 1 < n; ++i) {
            deltas[i] = values[i + 1] - values[i];
        }
        const std::span<const double> d(deltas);
        const std::size_t mid_d = d.size() / 2;
        const double early = mid_d > 0 ? stats::mean(d.first(mid_d)) : 0.0;
        const double late  = stats::mean(d.subspan(mid_d));
        acceleration = late - early;
    }

    out.trend_momentum       = momentum;
    out.trend_momentum_label = direction_of(momentum, config_.signals.momentum_label_band);
    out.trend_acceleration   = acceleration;
    out.quality = n >= 3 ? Quality::Ok : Quality::Degraded;
    return out;
}

// ─── Elasticity signal ────────────────────────────────────────────────────────

ElasticitySignal SignalEngine::elasticity(const Series& prices,
                                          const Series& sales) const {
    ElasticitySignal out;
    const auto p = values_of(most_recent(prices, config_.signals.elasticity_price_window));
    const auto d = values_of(most_recent(sales, config_.signals.elasticity_demand_window));

    if (p.empty() && d.empty()) {
        return out;
    }
    if (d.size() < constants::ELASTICITY_SIGNAL_MIN_DEMAND ||
        p.size() < constants::ELASTICITY_SIGNAL_MIN_PRICES) {
        out.quality = Quality::Degraded;
        return out;
    }
    if (stats::population_std(p) == 0.0 || stats::population_std(d) == 0.0) {
        out.quality = Quality::Degraded;
        return out;
    }

    const double corr = stats::zscore_correlation(p, d);
    out.elasticity_estimate = corr;
    out.elasticity_label = to_elasticity_label(stats::classify_level(
        std::abs(corr), config_.signals.correlation_low, config_.signals.correlation_medium));
    out.quality = Quality::Ok;
    return out;
}

// ─── compute ──────────────────────────────────────────────────────────────────

SignalSet SignalEngine::compute(std::string product_id,
                                double reference_price,
                                const SignalRows& rows,
                                Timestamp evaluated_at) const {
    const Series prices = normalize_series(rows.prices);
    const Series sales  = normalize_series(rows.sales);
    const Series scores = normalize_series(rows.trend_scores);

    SignalSet set;
    set.product_id      = std::move(product_id);
    set.reference_price = reference_price;
    set.evaluated_at    = evaluated_at;
    set.pricing         = pricing(reference_price, prices);
    set.demand          = demand(sales);
    set.trend           = trend(scores);
    set.elasticity      = elasticity(
        rows.elasticity_prices ? normalize_series(*rows.elasticity_prices) : prices,
        rows.elasticity_sales ? normalize_series(*rows.elasticity_sales) : sales);

    detail::trace(config_.verbose, "signals",
                  "{}: growth={}, momentum={}, position={:.4f}, volatility={}, elasticity={}",
                  set.product_id,
                  to_string(set.demand.demand_growth_label),
                  to_string(set.trend.trend_momentum_label),
                  set.pricing.price_position_index,
                  stats::to_string(set.pricing.price_volatility),
                  to_string(set.elasticity.elasticity_label));
    return set;
}

SignalSet SignalEngine::compute(std::string product_id,
                                double reference_price,
                                const Series& price_rows,
                                const Series& demand_rows,
                                const Series& trend_rows,
                                Timestamp evaluated_at) const {
    return compute(std::move(product_id), reference_price,
                   SignalRows{.prices = price_rows, .sales = demand_rows, .trend_scores = trend_rows},
                   evaluated_at);
}

SignalSet SignalEngine::compute(std::string product_id,
                                double reference_price,
                                const Series& price_rows,
                                const Series& demand_rows,
                                const Series& trend_rows) const {
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return compute(std::move(product_id), reference_price,
                   price_rows, demand_rows, trend_rows, now);
}

// ─── SignalSet ────────────────────────────────────────────────────────────────

Quality SignalSet::quality() const noexcept {
    return worst(worst(pricing.quality, demand.quality),
                 worst(trend.quality, elasticity.quality));
}

std::vector<std::pair<std::string, SignalValue>> SignalSet::entries() const {
    return {
        {"competitor_price_avg",   pricing.competitor_price_avg},
        {"price_variance",         pricing.price_variance},
        {"price_position_index",   pricing.price_position_index},
        {"price_volatility",       std::string(stats::to_string(pricing.price_volatility))},
        {"price_volatility_score", pricing.price_volatility_score},
        {"moving_avg_demand",      demand.moving_avg_demand},
        {"demand_growth_rate",     demand.demand_growth_rate},
        {"demand_growth_label",    std::string(signals::to_string(demand.demand_growth_label))},
        {"seasonal_index",         demand.seasonal_index},
        {"trend_momentum",         trend.trend_momentum},
        {"trend_momentum_label",   std::string(signals::to_string(trend.trend_momentum_label))},
        {"trend_acceleration",     trend.trend_acceleration},
        {"elasticity_estimate",    elasticity.elasticity_estimate},
        {"elasticity_label",       std::string(signals::to_string(elasticity.elasticity_label))},
    };
}

std::string SignalSet::to_string() const {
    std::string out = fmt::format("Signals for {} @ {} (price {:.2f}, quality {})\n",
                                  product_id, format_timestamp(evaluated_at),
                                  reference_price, prism::to_string(quality()));
    for (const auto& [name, value] : entries()) {
        if (const auto* num = std::get_if<double>(&value)) {
            out += fmt::format("  {:<24}{:.4f}\n", name, *num);
        } else {
            out += fmt::format("  {:<24}{}\n", name, std::get<std::string>(value));
        }
    }
    return out;
}

}  // namespace prism::signals
