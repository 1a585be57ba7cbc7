#pragma once

/// @file include/prism/elasticity.hpp
/// @brief Elasticity Estimator - log-log price elasticity of demand.
///
/// # Module: Elasticity Estimator
///
/// ## Responsibility
/// Fit log(demand) = a + ε·log(price) over (price, demand) pairs, classify
/// the sensitivity |ε|, derive an optimal-price band around the reference
/// price and sweep a 19-point price → demand → revenue curve.
///
/// ## Pairing Modes
/// - `DateMatched`   - daily average competitor price joined to the same
///                     day's units sold (≥ 10 usable days)
/// - `SyntheticRank` - fewer matched days: ascending prices zipped with
///                     descending demand. This pairing has no causal basis;
///                     it is reported as Degraded and must not be read as
///                     the true price/demand relationship.
/// - `Default`       - fewer than 5 usable pairs: fixed ε = −1.2, medium
///                     sensitivity, ±15% band, no curve
///
/// ## Guarantees
/// - Never throws; thin data yields a tagged default
/// - The curve (when fitted) has exactly 19 samples with strictly
///   increasing price for any reference price ≥ 1
/// - Stateless; `estimate` is const and safe to call concurrently

#include "prism/config.hpp"
#include "prism/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace prism::elasticity {

enum class Sensitivity { Low, Medium, High };

/// How the (price, demand) pairs behind a fit were built.
enum class PairingMode { DateMatched, SyntheticRank, Default };

[[nodiscard]] const char* to_string(Sensitivity s) noexcept;
[[nodiscard]] const char* to_string(PairingMode m) noexcept;

/// One point of the price sweep.
struct CurvePoint {
    double price   = 0.0;
    double demand  = 0.0;  ///< Whole units, ≥ 0
    double revenue = 0.0;
};

struct PriceRange {
    double min = 0.0;
    double max = 0.0;
};

/// Fitted elasticity for one product at one reference price.
struct ElasticityResult {
    double                  coefficient      = constants::DEFAULT_ELASTICITY;
    double                  intercept        = 0.0;
    Sensitivity             sensitivity      = Sensitivity::Medium;
    double                  r2               = 0.0;
    double                  cross_elasticity = constants::DEFAULT_CROSS_ELASTICITY;
    std::size_t             data_points      = 0;
    double                  reference_price  = 0.0;
    PriceRange              optimal_range{};
    std::vector<CurvePoint> curve;
    PairingMode             pairing          = PairingMode::Default;

    [[nodiscard]] std::string to_string() const;
};

/// (price, demand) observations used for the regression.
using PricePairs = std::vector<std::pair<double, double>>;

/// Estimates price elasticity from competitor-price and sales series.
class ElasticityEstimator {
public:
    explicit ElasticityEstimator(AnalyticsConfig config = AnalyticsConfig{});

    /// Estimate elasticity around `reference_price`.
    ///
    /// # Returns
    /// - Ok        - date-matched fit
    /// - Degraded  - synthetic pairing ("synthetic_pairing") or the fixed
    ///               default ("insufficient_data")
    [[nodiscard]] Outcome<ElasticityResult> estimate(double reference_price,
                                                     const Series& prices,
                                                     const Series& sales) const;

    /// Build regression pairs and report which pairing was used.
    [[nodiscard]] static std::pair<PricePairs, PairingMode>
    build_pairs(const Series& prices, const Series& sales);

    /// Price sweep for a fitted line at `reference_price`.
    [[nodiscard]] std::vector<CurvePoint> curve(double reference_price,
                                                double coefficient,
                                                double intercept) const;

    /// Sensitivity class of a coefficient: |ε| > 1.5 High, > 0.8 Medium.
    [[nodiscard]] static Sensitivity classify(double coefficient) noexcept;

    /// Half-width of the optimal band: 8% High, 12% Medium, 20% Low.
    [[nodiscard]] static double band_margin(Sensitivity s) noexcept;

    /// The fixed result reported when there is too little data.
    [[nodiscard]] static ElasticityResult default_result(double reference_price);

private:
    AnalyticsConfig config_;
};

} // namespace prism::elasticity
