#pragma once

/// @file include/prism/engine.hpp
/// @brief Pipeline Engine - runs the analytics components against a SeriesSource.
///
/// # Module: Pipeline Engine
///
/// ## Responsibility
/// Orchestrate the per-product pipeline:
///   SeriesSource rows → SignalEngine → {DemandForecaster, ElasticityEstimator}
///   → PriceOptimizer → DecisionEngine
///
/// The engine owns the fetch windows (how many rows, how far back) and the
/// collaborator fallbacks; the components themselves only see series.
///
/// ## Usage
/// ```cpp
/// auto source = DataLoader::load_csv("rows.csv");
/// if (source) {
///     Engine engine(*source);
///     fmt::print("{}", engine.analyze("sku-1").to_string());
/// }
/// ```
///
/// ## Guarantees
/// - Never throws for missing data; a source that throws a `std::exception`
///   is treated as returning an empty series
/// - Reference price falls back to 100.0 when the source has none
/// - All methods are const; the engine holds no per-call state

#include "prism/config.hpp"
#include "prism/data_source.hpp"
#include "prism/decision.hpp"
#include "prism/elasticity.hpp"
#include "prism/forecast.hpp"
#include "prism/optimizer.hpp"
#include "prism/signals.hpp"
#include "prism/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace prism::core {

/// Everything the pipeline produced for one product.
struct AnalysisReport {
    std::string product_id;
    double      reference_price          = constants::FALLBACK_REFERENCE_PRICE;
    bool        reference_price_fallback = false;

    signals::SignalSet                      signals;
    Outcome<forecast::Forecast>             forecast;
    Outcome<elasticity::ElasticityResult>   elasticity;
    Outcome<optimizer::OptimizationResult>  optimization;
    Outcome<decision::Decision>             decision;

    /// Worst quality over every stage.
    [[nodiscard]] Quality quality() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

class Engine {
public:
    /// # Arguments
    /// * `source` - Row collaborator; must outlive the engine
    /// * `config` - Parameters forwarded to every component
    /// * `as_of`  - Evaluation time for day-based windows; wall clock if unset
    explicit Engine(const SeriesSource& source,
                    AnalyticsConfig config = AnalyticsConfig{},
                    std::optional<Timestamp> as_of = std::nullopt);

    /// Evaluation time used for windows and stamped on signal sets.
    [[nodiscard]] Timestamp as_of() const;

    /// The source's reference price, or 100.0.
    [[nodiscard]] double reference_price(const std::string& product_id) const;

    /// Signal set over the most recent price, sales and trend rows up to
    /// `as_of()`; sales are further limited to the last 30 (demand) and 90
    /// (elasticity) days.
    [[nodiscard]] signals::SignalSet
    signals(const std::string& product_id,
            std::optional<double> reference_price = std::nullopt) const;

    /// Forecast from the last 180 days of sales and the latest trend score.
    [[nodiscard]] Outcome<forecast::Forecast>
    forecast(const std::string& product_id,
             int horizon_days = constants::DEFAULT_HORIZON_DAYS) const;

    /// Elasticity from the last 180 days of competitor prices and sales.
    [[nodiscard]] Outcome<elasticity::ElasticityResult>
    elasticity(const std::string& product_id,
               std::optional<double> reference_price = std::nullopt) const;

    /// Optimal price and scenarios.
    [[nodiscard]] Outcome<optimizer::OptimizationResult>
    optimize(const std::string& product_id,
             std::optional<double> reference_price = std::nullopt) const;

    /// Rule evaluation over a fresh signal set.
    [[nodiscard]] Outcome<decision::Decision>
    decide(const std::string& product_id,
           std::optional<double> reference_price = std::nullopt) const;

    /// Run every stage once.
    [[nodiscard]] AnalysisReport
    analyze(const std::string& product_id,
            int horizon_days = constants::DEFAULT_HORIZON_DAYS,
            std::optional<double> reference_price = std::nullopt) const;

    /// Portfolio KPIs over several products.
    [[nodiscard]] Outcome<signals::PortfolioKpis>
    portfolio(const std::vector<std::string>& product_ids) const;

private:
    /// Fetch rows in `[since, as_of()]` through the source; a thrown
    /// std::exception becomes an empty series.
    [[nodiscard]] Series fetch(const std::string& product_id,
                               SeriesKind kind,
                               Timestamp since,
                               std::size_t limit) const;

    /// Positive reference price from the source, or `nullopt`.
    [[nodiscard]] std::optional<double> fetch_reference_price(const std::string& product_id) const;

    [[nodiscard]] optimizer::MarketInputs
    market_inputs(const std::string& product_id, double current_price) const;

    [[nodiscard]] Outcome<optimizer::OptimizationResult>
    optimize_with(const std::string& product_id,
                  double current_price,
                  const Outcome<elasticity::ElasticityResult>& fit) const;

    [[nodiscard]] Timestamp days_back(int days) const;

    const SeriesSource&              source_;
    AnalyticsConfig                  config_;
    std::optional<Timestamp>         as_of_;
    signals::SignalEngine            signal_engine_;
    forecast::DemandForecaster       forecaster_;
    elasticity::ElasticityEstimator  estimator_;
    optimizer::PriceOptimizer        optimizer_;
    decision::DecisionEngine         decision_engine_;
};

}  // namespace prism::core
