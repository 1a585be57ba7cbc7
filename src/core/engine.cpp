/// @file src/core/engine.cpp
/// @brief Pipeline Engine.

#include "prism/engine.hpp"

#include "diagnostics.hpp"

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <limits>
#include <utility>

namespace prism::core {

namespace {

constexpr std::size_t kUnlimited = std::numeric_limits<std::size_t>::max();

}  // namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(const SeriesSource& source,
               AnalyticsConfig config,
               std::optional<Timestamp> as_of)
    : source_(source)
    , config_(std::move(config))
    , as_of_(as_of)
    , signal_engine_(config_)
    , forecaster_(config_)
    , estimator_(config_)
    , optimizer_(config_)
    , decision_engine_(config_)
{}

Timestamp Engine::as_of() const {
    if (as_of_) {
        return *as_of_;
    }
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

Timestamp Engine::days_back(int days) const {
    return as_of() - std::chrono::days{days};
}

// ─── Collaborator access ──────────────────────────────────────────────────────

Series Engine::fetch(const std::string& product_id,
                     SeriesKind kind,
                     Timestamp since,
                     std::size_t limit) const {
    try {
        return source_.fetch_series(product_id, kind, since, as_of(), limit);
    } catch (const std::exception& e) {
        detail::trace(config_.verbose, "engine",
                      "warning: fetch of {} for {} failed ({}), using empty series",
                      prism::to_string(kind), product_id, e.what());
        return {};
    }
}

std::optional<double> Engine::fetch_reference_price(const std::string& product_id) const {
    std::optional<double> price;
    try {
        price = source_.fetch_reference_price(product_id);
    } catch (const std::exception& e) {
        detail::trace(config_.verbose, "engine",
                      "warning: reference price for {} unavailable ({})", product_id, e.what());
        return std::nullopt;
    }
    if (price && !(*price > 0.0)) {
        return std::nullopt;
    }
    return price;
}

double Engine::reference_price(const std::string& product_id) const {
    return fetch_reference_price(product_id).value_or(constants::FALLBACK_REFERENCE_PRICE);
}

// ─── Stages ───────────────────────────────────────────────────────────────────

signals::SignalSet Engine::signals(const std::string& product_id,
                                   std::optional<double> price) const {
    const double ref = price ? *price : reference_price(product_id);
    const auto&  w   = config_.signals;

    signals::SignalRows rows{
        .prices       = fetch(product_id, SeriesKind::CompetitorPrice,
                              beginning_of_time(), w.price_window),
        .sales        = fetch(product_id, SeriesKind::UnitsSold,
                              days_back(w.demand_days), w.demand_window),
        .trend_scores = fetch(product_id, SeriesKind::TrendScore,
                              beginning_of_time(), w.trend_window),
        .elasticity_prices = fetch(product_id, SeriesKind::CompetitorPrice,
                                   beginning_of_time(), w.elasticity_price_window),
        .elasticity_sales  = fetch(product_id, SeriesKind::UnitsSold,
                                   days_back(w.elasticity_days), w.elasticity_demand_window),
    };
    return signal_engine_.compute(product_id, ref, rows, as_of());
}

Outcome<forecast::Forecast> Engine::forecast(const std::string& product_id,
                                             int horizon_days) const {
    const Series sales = fetch(product_id, SeriesKind::UnitsSold,
                               days_back(constants::FORECAST_HISTORY_DAYS),
                               constants::FORECAST_HISTORY_ROWS);
    const Series trend = fetch(product_id, SeriesKind::TrendScore, beginning_of_time(), 1);

    std::optional<double> latest_score;
    if (!trend.empty()) {
        latest_score = trend.back().value;
    }
    return forecaster_.forecast(product_id, sales, latest_score, horizon_days);
}

Outcome<elasticity::ElasticityResult>
Engine::elasticity(const std::string& product_id, std::optional<double> price) const {
    const double ref = price ? *price : reference_price(product_id);
    const Timestamp since = days_back(constants::ELASTICITY_HISTORY_DAYS);
    return estimator_.estimate(
        ref,
        fetch(product_id, SeriesKind::CompetitorPrice, since, constants::ELASTICITY_PRICE_ROWS),
        fetch(product_id, SeriesKind::UnitsSold, since, constants::ELASTICITY_SALES_ROWS));
}

optimizer::MarketInputs Engine::market_inputs(const std::string& product_id,
                                              double current_price) const {
    optimizer::MarketInputs market;
    market.current_price = current_price;

    const Series quotes = fetch(product_id, SeriesKind::CompetitorPrice,
                                beginning_of_time(), constants::COMPETITOR_AVG_ROWS);
    if (!quotes.empty()) {
        market.competitor_avg = stats::mean(values_of(quotes));
    }

    const Series recent = fetch(product_id, SeriesKind::UnitsSold,
                                days_back(constants::RECENT_DEMAND_DAYS), kUnlimited);
    if (!recent.empty()) {
        market.avg_demand = stats::mean(values_of(recent));
    }
    return market;
}

Outcome<optimizer::OptimizationResult>
Engine::optimize_with(const std::string& product_id,
                      double current_price,
                      const Outcome<elasticity::ElasticityResult>& fit) const {
    return optimizer_.optimize(product_id, market_inputs(product_id, current_price), fit);
}

Outcome<optimizer::OptimizationResult>
Engine::optimize(const std::string& product_id, std::optional<double> price) const {
    const double current = price ? *price : reference_price(product_id);
    return optimize_with(product_id, current, elasticity(product_id, current));
}

Outcome<decision::Decision>
Engine::decide(const std::string& product_id, std::optional<double> price) const {
    return decision_engine_.evaluate(signals(product_id, price));
}

// ─── analyze ──────────────────────────────────────────────────────────────────

AnalysisReport Engine::analyze(const std::string& product_id,
                               int horizon_days,
                               std::optional<double> price) const {
    AnalysisReport report;
    report.product_id = product_id;
    if (price) {
        report.reference_price = *price;
    } else if (const auto fetched = fetch_reference_price(product_id)) {
        report.reference_price = *fetched;
    } else {
        report.reference_price          = constants::FALLBACK_REFERENCE_PRICE;
        report.reference_price_fallback = true;
    }

    report.signals      = signals(product_id, report.reference_price);
    report.forecast     = forecast(product_id, horizon_days);
    report.elasticity   = elasticity(product_id, report.reference_price);
    report.optimization = optimize_with(product_id, report.reference_price, report.elasticity);
    report.decision     = decision_engine_.evaluate(report.signals);

    detail::trace(config_.verbose, "engine", "{}: analysis complete, quality={}",
                  product_id, prism::to_string(report.quality()));
    return report;
}

Outcome<signals::PortfolioKpis>
Engine::portfolio(const std::vector<std::string>& product_ids) const {
    std::vector<signals::SignalSet> sets;
    sets.reserve(product_ids.size());
    for (const auto& id : product_ids) {
        sets.push_back(signals(id));
    }
    return signals::summarize_portfolio(sets);
}

// ─── AnalysisReport ───────────────────────────────────────────────────────────

Quality AnalysisReport::quality() const noexcept {
    Quality q = worst(signals.quality(), forecast.quality);
    q = worst(q, elasticity.quality);
    q = worst(q, optimization.quality);
    return worst(q, decision.quality);
}

std::string AnalysisReport::to_string() const {
    std::string out = fmt::format("=== {} (reference price {:.2f}{}) ===\n",
                                  product_id, reference_price,
                                  reference_price_fallback ? ", fallback" : "");
    out += signals.to_string();
    out += forecast->to_string();
    if (!forecast.reason.empty()) {
        out += fmt::format("  forecast quality: {} ({})\n",
                           prism::to_string(forecast.quality), forecast.reason);
    }
    out += elasticity->to_string();
    if (!elasticity.reason.empty()) {
        out += fmt::format("  elasticity quality: {} ({})\n",
                           prism::to_string(elasticity.quality), elasticity.reason);
    }
    out += optimization->to_string();
    out += decision->to_string();
    return out;
}

}  // namespace prism::core
