#pragma once

/// @file include/prism/forecast.hpp
/// @brief Demand Forecaster - Holt-Winters decomposition and projection.
///
/// # Module: Demand Forecaster
///
/// ## Responsibility
/// Decompose a daily unit-sales series into level, trend and a weekly
/// seasonal profile (triple exponential smoothing), then project a
/// 7–30 day forecast with widening confidence bands and flag the future
/// days whose seasonal factor marks a demand spike.
///
/// ## Model
///   level_t    = α·(v_t / s_t) + (1−α)·(level + trend)
///   trend_t    = β·(level_t − level) + (1−β)·trend
///   s_t        = γ·(v_t / level_t) + (1−γ)·s_t
///   forecast_d = max(0, (level + trend·d) · s[(d−1) mod m] · k)
///   band_d     = ±1.96 · σ_residual · √d
///
/// where k = 0.95 + trend_score/500 scales the projection by search
/// interest (neutral score 50 → k = 1.05).
///
/// ## Failure Model
/// - No sales rows: empty predictions, confidence 0, metrics error
///   "insufficient_data", Outcome quality Empty. Callers must read this as
///   "cannot forecast", never as zero demand.
/// - Fewer than two seasons: seasonal decomposition is skipped and the
///   Outcome is Degraded.
///
/// ## Guarantees
/// - lower ≤ point ≤ upper and lower ≥ 0 for every predicted day
/// - Confidence is non-increasing in the horizon for a fixed series
/// - Stateless; `forecast` is const and safe to call concurrently

#include "prism/config.hpp"
#include "prism/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace prism::forecast {

/// One predicted day.
struct DailyForecast {
    Date        date;
    double      point_estimate = 0.0;
    double      lower_bound    = 0.0;
    double      upper_bound    = 0.0;
    const char* day_of_week    = "";
};

/// A future day flagged as a seasonal demand spike.
struct SpikePeriod {
    Date        date;
    double      seasonal_index = 0.0;
    const char* day_of_week    = "";
};

/// Output of the decomposition step.
struct Decomposition {
    double              level        = 0.0;
    double              trend        = 0.0;
    std::vector<double> seasonal;           ///< One factor per phase
    double              residual_std = 0.0;
    bool                seasonal_fit = false;  ///< false when history was too short
};

/// Fit diagnostics reported alongside the predictions.
struct ModelMetrics {
    std::string algorithm        = "Holt-Winters Triple Exponential Smoothing";
    std::size_t training_points  = 0;
    double      level            = 0.0;
    double      trend_per_day    = 0.0;
    double      trend_multiplier = 1.0;
    double      residual_std     = 0.0;
    std::string error;  ///< "insufficient_data" when nothing could be fitted
};

/// A complete forecast for one product.
struct Forecast {
    std::string                product_id;
    int                        horizon_days = 0;
    std::vector<DailyForecast> predictions;
    double                     confidence = 0.0;
    std::vector<SpikePeriod>   spike_periods;
    ModelMetrics               metrics;

    /// Mean point estimate, 0 when there are no predictions.
    [[nodiscard]] double average_prediction() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

/// Clamp a requested horizon into [7, 30].
[[nodiscard]] int clamp_horizon(int horizon_days) noexcept;

/// Holt-Winters demand forecaster.
class DemandForecaster {
public:
    explicit DemandForecaster(AnalyticsConfig config = AnalyticsConfig{});

    /// Forecast `horizon_days` (clamped to 7–30) beyond the last sales day.
    ///
    /// # Arguments
    /// * `product_id`   - Product the series belongs to
    /// * `sales`        - Daily units sold (any order; invalid rows dropped)
    /// * `trend_score`  - Latest trend score, `nullopt` → neutral 50
    /// * `horizon_days` - Requested horizon
    [[nodiscard]] Outcome<Forecast> forecast(std::string product_id,
                                             const Series& sales,
                                             std::optional<double> trend_score,
                                             int horizon_days = constants::DEFAULT_HORIZON_DAYS) const;

    /// Decompose a plain value series into level, trend and seasonality.
    [[nodiscard]] Decomposition decompose(std::span<const double> values) const;

    /// Spike days among the `horizon` days starting at `start`.
    [[nodiscard]] static std::vector<SpikePeriod>
    detect_spikes(std::span<const double> seasonal, Date start, int horizon);

    /// Overall confidence for a fit.
    ///
    /// clamp(0.4, 0.98, max(0.5, 1 − σ/avg) · (1 − horizon/100)),
    /// noise ratio 0.5 when avg ≤ 0.
    [[nodiscard]] static double confidence(double residual_std,
                                           double avg_recent_demand,
                                           int horizon_days) noexcept;

private:
    AnalyticsConfig config_;
};

} // namespace prism::forecast
