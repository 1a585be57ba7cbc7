/// @file src/stats/statistics.cpp
/// @brief Mean, population std-dev, OLS and z-score correlation.
///
/// Reductions run on Eigen maps over the caller's memory.

#include "prism/statistics.hpp"
#include "prism/constants.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace prism::stats {

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

ConstVectorMap as_vector(std::span<const double> v) noexcept {
    return ConstVectorMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace

// ─── Level ────────────────────────────────────────────────────────────────────

const char* to_string(Level level) noexcept {
    switch (level) {
        case Level::Low:    return "low";
        case Level::Medium: return "medium";
        case Level::High:   return "high";
    }
    return "low";
}

Level classify_level(double value, double low, double high) noexcept {
    if (value <= low)  return Level::Low;
    if (value <= high) return Level::Medium;
    return Level::High;
}

// ─── mean / population_std ────────────────────────────────────────────────────

double mean(std::span<const double> values) noexcept {
    if (values.empty()) {
        return 0.0;
    }
    return as_vector(values).mean();
}

double population_std(std::span<const double> values) noexcept {
    if (values.size() < 2) {
        return 0.0;
    }
    const auto v = as_vector(values);
    const double mu = v.mean();
    const double ss = (v.array() - mu).square().sum();
    return std::sqrt(ss / static_cast<double>(values.size()));
}

// ─── ols ──────────────────────────────────────────────────────────────────────

OlsFit ols(std::span<const double> x, std::span<const double> y) noexcept {
    OlsFit fit;
    fit.n = x.size();

    if (x.size() != y.size() || x.size() < constants::OLS_MIN_POINTS) {
        fit.intercept = mean(y);
        return fit;
    }

    const auto vx = as_vector(x);
    const auto vy = as_vector(y);
    const double n = static_cast<double>(x.size());

    // Centered sums; n·sxx equals n·Σx² − (Σx)² without the cancellation.
    const Eigen::ArrayXd dx = vx.array() - vx.mean();
    const Eigen::ArrayXd dy = vy.array() - vy.mean();
    const double sxx = dx.square().sum();
    const double sxy = (dx * dy).sum();

    if (std::abs(n * sxx) < constants::OLS_DEGENERATE_EPSILON) {
        // Constant x: no slope is identifiable.
        fit.intercept = vy.mean();
        return fit;
    }

    fit.slope     = sxy / sxx;
    fit.intercept = vy.mean() - fit.slope * vx.mean();

    const double ss_tot = dy.square().sum();
    const double ss_res =
        (vy.array() - (fit.intercept + fit.slope * vx.array())).square().sum();

    fit.r2 = ss_tot > 0.0 ? std::max(0.0, 1.0 - ss_res / ss_tot) : 0.0;
    return fit;
}

// ─── zscore_correlation ───────────────────────────────────────────────────────

double zscore_correlation(std::span<const double> x,
                          std::span<const double> y) noexcept {
    const std::size_t n = std::min(x.size(), y.size());
    if (n == 0) {
        return 0.0;
    }

    const double mx = mean(x);
    const double my = mean(y);
    const double sx = population_std(x);
    const double sy = population_std(y);
    if (sx == 0.0 || sy == 0.0) {
        return 0.0;
    }

    const auto zx = (as_vector(x.first(n)).array() - mx) / sx;
    const auto zy = (as_vector(y.first(n)).array() - my) / sy;
    return (zx * zy).sum() / static_cast<double>(n);
}

}  // namespace prism::stats
