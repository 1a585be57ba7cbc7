#pragma once

/// @file include/prism/statistics.hpp
/// @brief Descriptive statistics and ordinary least squares.
///
/// # Module: Statistics
///
/// ## Responsibility
/// The small numeric kernel shared by the signal engine, the forecaster and
/// the elasticity estimator. Pure functions over `std::span<const double>`;
/// Eigen maps the spans for the reductions, no copies are made.
///
/// ## Guarantees
/// - Never divides by zero; degenerate input returns the neutral value
/// - No I/O, no state, safe to call concurrently

#include <cstddef>
#include <span>

namespace prism::stats {

/// Result of a simple linear regression y = intercept + slope·x.
struct OlsFit {
    double      slope     = 0.0;
    double      intercept = 0.0;
    double      r2        = 0.0;  ///< Coefficient of determination, ≥ 0
    std::size_t n         = 0;    ///< Points used
};

/// Three-way bucket used by several signal labels.
enum class Level { Low, Medium, High };

[[nodiscard]] const char* to_string(Level level) noexcept;

/// Arithmetic mean. 0.0 for an empty span.
[[nodiscard]] double mean(std::span<const double> values) noexcept;

/// Population standard deviation (divides by n). 0.0 for fewer than 2 values.
[[nodiscard]] double population_std(std::span<const double> values) noexcept;

/// Ordinary least squares fit of y on x.
///
/// # Returns
/// The fitted line with R² clamped to ≥ 0. Soft-fails to slope 0, R² 0 and
/// intercept mean(y) when:
///   - fewer than 3 points, or x and y differ in length
///   - |n·Σx² − (Σx)²| < 1e-10 (constant x)
[[nodiscard]] OlsFit ols(std::span<const double> x, std::span<const double> y) noexcept;

/// Bucket `value`: ≤ low → Low, ≤ high → Medium, otherwise High.
[[nodiscard]] Level classify_level(double value, double low, double high) noexcept;

/// Mean product of z-scores over the first min(|x|, |y|) points.
///
/// z-scores use each full series' mean and population std. Returns 0.0 when
/// either series is empty or has zero variance.
[[nodiscard]] double zscore_correlation(std::span<const double> x,
                                        std::span<const double> y) noexcept;

} // namespace prism::stats
