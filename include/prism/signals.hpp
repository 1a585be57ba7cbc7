#pragma once

/// @file include/prism/signals.hpp
/// @brief Signal Engine - feature engineering from raw observation rows.
///
/// # Module: Signal Engine
///
/// ## Responsibility
/// Turn a product's competitor-price, unit-sales and trend-score series into
/// one immutable SignalSet of ~10 named signals:
///
///   Pricing    competitor_price_avg, price_variance, price_position_index,
///              price_volatility (+ score)
///   Demand     moving_avg_demand, demand_growth_rate (+ label),
///              seasonal_index
///   Trend      trend_momentum (+ label), trend_acceleration
///   Elasticity elasticity_estimate (+ label)
///
/// ## Failure Model
/// Each block is computed independently. A block with no or too little data
/// returns its documented defaults and records a degraded/empty quality; one
/// thin block never blocks the others.
///
/// ## Guarantees
/// - Stateless: `compute` is const and safe to call concurrently
/// - Input series may be unsorted, empty, or hold invalid values
///
/// ## NOT Responsible For
/// - Fetching rows (see data_source.hpp / engine.hpp)
/// - Acting on the signals (see decision.hpp)

#include "prism/config.hpp"
#include "prism/statistics.hpp"
#include "prism/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace prism::signals {

// ─── Labels ───────────────────────────────────────────────────────────────────

/// Direction of a growth or momentum signal.
enum class Direction { Rising, Falling, Stable };

/// Strength of the price/demand correlation; Unknown when not computable.
enum class ElasticityLabel { Unknown, Low, Medium, High };

[[nodiscard]] const char* to_string(Direction d) noexcept;
[[nodiscard]] const char* to_string(ElasticityLabel l) noexcept;

// ─── Blocks ───────────────────────────────────────────────────────────────────

struct PricingSignals {
    double       competitor_price_avg   = 0.0;
    double       price_variance         = 0.0;  ///< population std of prices
    double       price_position_index   = 1.0;  ///< reference / competitor avg
    stats::Level price_volatility       = stats::Level::Low;
    double       price_volatility_score = 0.0;  ///< coefficient of variation
    Quality      quality                = Quality::Empty;
};

struct DemandSignals {
    double    moving_avg_demand   = 0.0;
    double    demand_growth_rate  = 0.0;
    Direction demand_growth_label = Direction::Stable;
    double    seasonal_index      = 1.0;  ///< weekend avg / weekday avg
    Quality   quality             = Quality::Empty;
};

struct TrendSignals {
    double    trend_momentum       = 0.0;
    Direction trend_momentum_label = Direction::Stable;
    double    trend_acceleration   = 0.0;
    Quality   quality              = Quality::Empty;
};

struct ElasticitySignal {
    double          elasticity_estimate = 0.0;  ///< z-score correlation
    ElasticityLabel elasticity_label    = ElasticityLabel::Unknown;
    Quality         quality             = Quality::Empty;
};

/// Value of one named signal.
using SignalValue = std::variant<double, std::string>;

/// All signals for one (product, reference price, evaluation time).
struct SignalSet {
    std::string      product_id;
    double           reference_price = 0.0;
    Timestamp        evaluated_at{};
    PricingSignals   pricing{};
    DemandSignals    demand{};
    TrendSignals     trend{};
    ElasticitySignal elasticity{};

    /// Worst quality over the four blocks.
    [[nodiscard]] Quality quality() const noexcept;

    /// Flat name → value view, in a fixed order.
    [[nodiscard]] std::vector<std::pair<std::string, SignalValue>> entries() const;

    /// Multi-line human-readable dump.
    [[nodiscard]] std::string to_string() const;
};

// ─── SignalRows ───────────────────────────────────────────────────────────────

/// Raw rows for one evaluation. The elasticity block reads its own windows
/// when they are set and falls back to `prices` / `sales` otherwise.
struct SignalRows {
    Series                prices;             ///< competitor quotes
    Series                sales;              ///< daily units sold
    Series                trend_scores;
    std::optional<Series> elasticity_prices;
    std::optional<Series> elasticity_sales;
};

// ─── SignalEngine ─────────────────────────────────────────────────────────────

/// Computes SignalSets from raw observation series.
class SignalEngine {
public:
    explicit SignalEngine(AnalyticsConfig config = AnalyticsConfig{});

    /// Compute every signal block for one product.
    ///
    /// # Arguments
    /// * `product_id`      - Product the rows belong to
    /// * `reference_price` - The product's own current price
    /// * `price_rows`      - Competitor price observations (any order)
    /// * `demand_rows`     - Daily units-sold observations (any order)
    /// * `trend_rows`      - Trend-score observations (any order)
    /// * `evaluated_at`    - Evaluation time stamped on the set
    [[nodiscard]] SignalSet compute(std::string product_id,
                                    double reference_price,
                                    const Series& price_rows,
                                    const Series& demand_rows,
                                    const Series& trend_rows,
                                    Timestamp evaluated_at) const;

    /// As above, stamped with the current wall-clock time.
    [[nodiscard]] SignalSet compute(std::string product_id,
                                    double reference_price,
                                    const Series& price_rows,
                                    const Series& demand_rows,
                                    const Series& trend_rows) const;

    /// As above, with separate elasticity windows.
    [[nodiscard]] SignalSet compute(std::string product_id,
                                    double reference_price,
                                    const SignalRows& rows,
                                    Timestamp evaluated_at) const;

    // ── Individual blocks (ascending, sanitised input expected) ──────────────

    [[nodiscard]] PricingSignals pricing(double reference_price,
                                         const Series& prices) const;

    [[nodiscard]] DemandSignals demand(const Series& sales) const;

    [[nodiscard]] TrendSignals trend(const Series& scores) const;

    [[nodiscard]] ElasticitySignal elasticity(const Series& prices,
                                              const Series& sales) const;

private:
    AnalyticsConfig config_;
};

// ─── Portfolio KPIs ───────────────────────────────────────────────────────────

/// Aggregate indicators over several products' signal sets.
struct PortfolioKpis {
    std::size_t total_products        = 0;
    double      est_daily_revenue     = 0.0;  ///< Σ price · max(MA, 1)
    double      est_monthly_revenue   = 0.0;
    double      avg_demand_growth     = 0.0;
    double      avg_price_position    = 1.0;
    double      avg_trend_momentum    = 0.0;
    std::size_t volatility_low        = 0;
    std::size_t volatility_medium     = 0;
    std::size_t volatility_high       = 0;

    [[nodiscard]] std::string to_string() const;
};

/// Aggregate KPIs. Empty input yields an Empty outcome with neutral values.
[[nodiscard]] Outcome<PortfolioKpis> summarize_portfolio(std::span<const SignalSet> sets);

} // namespace prism::signals
