/// @file src/forecast/demand_forecaster.cpp
/// @brief Holt-Winters decomposition, projection, spikes and confidence.

#include "prism/forecast.hpp"
#include "prism/statistics.hpp"

#include "../core/diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace prism::forecast {

// ─── Helpers ──────────────────────────────────────────────────────────────────

int clamp_horizon(int horizon_days) noexcept {
    return std::clamp(horizon_days, constants::MIN_HORIZON_DAYS, constants::MAX_HORIZON_DAYS);
}

double Forecast::average_prediction() const noexcept {
    if (predictions.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& p : predictions) {
        sum += p.point_estimate;
    }
    return sum / static_cast<double>(predictions.size());
}

// ─── Construction ─────────────────────────────────────────────────────────────

DemandForecaster::DemandForecaster(AnalyticsConfig config)
    : config_(std::move(config)) {
    if (config_.forecast.season_length == 0) {
        config_.forecast.season_length = constants::HW_SEASON_LENGTH;
    }
}

// ─── decompose ────────────────────────────────────────────────────────────────

Decomposition DemandForecaster::decompose(std::span<const double> values) const {
    const std::size_t m = config_.forecast.season_length;
    const std::size_t n = values.size();
    const double alpha  = config_.forecast.alpha;
    const double beta   = config_.forecast.beta;
    const double gamma  = config_.forecast.gamma;

    Decomposition out;

    if (n < 2 * m) {
        // Not enough history for a seasonal profile: straight line through
        // the endpoints, flat seasonality.
        out.level    = n > 0 ? values.back() : 0.0;
        out.trend    = n >= 2 ? (values.back() - values.front()) / static_cast<double>(n - 1) : 0.0;
        out.seasonal.assign(m, 1.0);
        return out;
    }

    const double initial = stats::mean(values.first(m));
    out.seasonal.resize(m);
    for (std::size_t i = 0; i < m; ++i) {
        out.seasonal[i] = initial > 0.0 ? values[i] / initial : 1.0;
    }

    double level = initial;
    double trend = (stats::mean(values.subspan(m, m)) - initial) / static_cast<double>(m);

    std::vector<double> residuals;
    residuals.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t phase = i % m;
        const double s = out.seasonal[phase];
        const double v = values[i];

        const double new_level = s > 0.0
            ? alpha * (v / s) + (1.0 - alpha) * (level + trend)
            : alpha * v + (1.0 - alpha) * (level + trend);
        const double new_trend = beta * (new_level - level) + (1.0 - beta) * trend;

        if (new_level > 0.0) {
            out.seasonal[phase] = gamma * (v / new_level) + (1.0 - gamma) * s;
        }

        // Fitted value uses the state before this step's update.
        residuals.push_back(v - (level + trend) * s);

        level = new_level;
        trend = new_trend;
    }

    out.level        = level;
    out.trend        = trend;
    out.residual_std = stats::population_std(residuals);
    out.seasonal_fit = true;
    return out;
}

// ─── detect_spikes ────────────────────────────────────────────────────────────

std::vector<SpikePeriod>
DemandForecaster::detect_spikes(std::span<const double> seasonal, Date start, int horizon) {
    std::vector<SpikePeriod> spikes;
    if (seasonal.empty() || horizon <= 0) {
        return spikes;
    }

    const double threshold = *std::max_element(seasonal.begin(), seasonal.end()) * 0.85;

    for (int day = 0; day < horizon; ++day) {
        const double s = seasonal[static_cast<std::size_t>(day) % seasonal.size()];
        if (s >= threshold && s > 1.1) {
            const Date d = start + std::chrono::days{day};
            spikes.push_back(SpikePeriod{d, s, weekday_name(d)});
        }
    }
    return spikes;
}

// ─── confidence ───────────────────────────────────────────────────────────────

double DemandForecaster::confidence(double residual_std,
                                    double avg_recent_demand,
                                    int horizon_days) noexcept {
    const double noise_ratio = avg_recent_demand > 0.0 ? residual_std / avg_recent_demand : 0.5;
    const double base        = std::max(0.5, 1.0 - noise_ratio);
    const double penalty     = 1.0 - static_cast<double>(horizon_days) / 100.0;
    return std::clamp(base * penalty, 0.4, 0.98);
}

// ─── forecast ─────────────────────────────────────────────────────────────────

Outcome<Forecast> DemandForecaster::forecast(std::string product_id,
                                             const Series& sales,
                                             std::optional<double> trend_score,
                                             int horizon_days) const {
    const int horizon = clamp_horizon(horizon_days);

    Forecast out;
    out.product_id   = std::move(product_id);
    out.horizon_days = horizon;

    const Series rows = normalize_series(sales);
    if (rows.empty()) {
        out.metrics.error = "insufficient_data";
        detail::trace(config_.verbose, "forecast", "{}: no sales data", out.product_id);
        return Outcome<Forecast>::empty(std::move(out), "insufficient_data");
    }

    const auto values = values_of(rows);
    const Date last_day = to_date(rows.back().time);

    const double score      = trend_score.value_or(constants::NEUTRAL_TREND_SCORE);
    const double multiplier = 0.95 + score / 500.0;

    const Decomposition fit = decompose(values);
    const std::size_t m = fit.seasonal.size();

    out.predictions.reserve(static_cast<std::size_t>(horizon));
    for (int day = 1; day <= horizon; ++day) {
        const double s = fit.seasonal[static_cast<std::size_t>(day - 1) % m];
        const double point = std::max(
            0.0, (fit.level + fit.trend * day) * s * multiplier);
        const double band = constants::CONFIDENCE_Z * fit.residual_std * std::sqrt(static_cast<double>(day));

        const Date d = last_day + std::chrono::days{day};
        out.predictions.push_back(DailyForecast{
            .date           = d,
            .point_estimate = point,
            .lower_bound    = std::max(0.0, point - band),
            .upper_bound    = point + band,
            .day_of_week    = weekday_name(d),
        });
    }

    const std::span<const double> all(values);
    const double avg_recent =
        stats::mean(all.last(std::min(all.size(), constants::FORECAST_RECENT_WINDOW)));
    out.confidence    = confidence(fit.residual_std, avg_recent, horizon);
    out.spike_periods = detect_spikes(fit.seasonal, last_day + std::chrono::days{1}, horizon);

    out.metrics.training_points  = values.size();
    out.metrics.level            = fit.level;
    out.metrics.trend_per_day    = fit.trend;
    out.metrics.trend_multiplier = multiplier;
    out.metrics.residual_std     = fit.residual_std;

    detail::trace(config_.verbose, "forecast",
                  "{}: {} days, confidence={:.2f}, avg_predicted={:.0f}/day, {} spike periods",
                  out.product_id, horizon, out.confidence,
                  out.average_prediction(), out.spike_periods.size());

    if (!fit.seasonal_fit) {
        return Outcome<Forecast>::degraded(std::move(out), "short_history");
    }
    return Outcome<Forecast>::ok(std::move(out));
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string Forecast::to_string() const {
    if (predictions.empty()) {
        return fmt::format("Forecast for {}: no predictions ({})\n",
                           product_id, metrics.error.empty() ? "none" : metrics.error);
    }

    std::string out = fmt::format(
        "Forecast for {}: {} days, confidence {:.1f}%, level {:.2f}, trend {:+.4f}/day\n",
        product_id, horizon_days, confidence * 100.0, metrics.level, metrics.trend_per_day);
    for (const auto& p : predictions) {
        out += fmt::format("  {} {:<9}  {:8.1f}  [{:8.1f}, {:8.1f}]\n",
                           format_date(p.date), p.day_of_week,
                           p.point_estimate, p.lower_bound, p.upper_bound);
    }
    for (const auto& s : spike_periods) {
        out += fmt::format("  spike: {} ({}) seasonal={:.3f}\n",
                           format_date(s.date), s.day_of_week, s.seasonal_index);
    }
    return out;
}

}  // namespace prism::forecast
