#pragma once

/// @file include/prism/config.hpp
/// @brief AnalyticsConfig - the read-only parameter set shared by every
///        PRISM component.
///
/// A config is built once (defaults below, optionally overridden from the
/// CLI) and copied into each component at construction. Nothing in the
/// pipeline mutates it afterwards.

#include "prism/constants.hpp"

#include <cstddef>

namespace prism {

/// Holt-Winters smoothing parameters.
struct ForecastConfig {
    double      alpha         = constants::HW_ALPHA;          ///< level smoothing
    double      beta          = constants::HW_BETA;           ///< trend smoothing
    double      gamma         = constants::HW_GAMMA;          ///< seasonal smoothing
    std::size_t season_length = constants::HW_SEASON_LENGTH;  ///< days per season
};

/// Observation windows and label thresholds for the signal engine.
struct SignalConfig {
    std::size_t price_window             = constants::PRICE_WINDOW;
    std::size_t demand_window            = constants::DEMAND_WINDOW;
    std::size_t trend_window             = constants::TREND_WINDOW;
    std::size_t elasticity_price_window  = constants::ELASTICITY_PRICE_WINDOW;
    std::size_t elasticity_demand_window = constants::ELASTICITY_DEMAND_WINDOW;
    std::size_t moving_average_days      = constants::MOVING_AVERAGE_DAYS;
    int         demand_days              = constants::DEMAND_SIGNAL_DAYS;
    int         elasticity_days          = constants::ELASTICITY_SIGNAL_DAYS;

    double volatility_low      = constants::VOLATILITY_LOW;
    double volatility_medium   = constants::VOLATILITY_MEDIUM;
    double growth_label_band   = constants::GROWTH_LABEL_BAND;
    double momentum_label_band = constants::MOMENTUM_LABEL_BAND;
    double correlation_low     = constants::CORRELATION_LOW;
    double correlation_medium  = constants::CORRELATION_MEDIUM;
};

/// Price sweep used to build the elasticity curve, in percent of reference.
struct CurveConfig {
    int min_pct  = constants::CURVE_MIN_PCT;
    int max_pct  = constants::CURVE_MAX_PCT;
    int step_pct = constants::CURVE_STEP_PCT;
};

/// Trigger thresholds of the six decision rules.
struct RuleThresholds {
    double overpriced_position    = 1.10;   ///< rule 1: position above this
    double surge_growth           = 0.15;   ///< rule 2: growth above this …
    double surge_momentum         = 10.0;   ///< … and momentum above this
    double slump_growth           = -0.15;  ///< rule 3: growth below this
    double off_season_index       = 0.9;    ///< rule 4: seasonal below this …
    double off_season_growth      = 0.0;    ///< … and growth below this
    double trend_surge_momentum   = 15.0;   ///< rule 5: momentum above this …
    double trend_surge_growth     = 0.05;   ///< … and growth below this
    double underpriced_position   = 0.85;   ///< rule 6: position below this
};

/// Complete parameter set for the pipeline.
struct AnalyticsConfig {
    ForecastConfig forecast{};
    SignalConfig   signals{};
    CurveConfig    curve{};
    RuleThresholds rules{};

    /// If true, components write diagnostic lines to stderr.
    bool verbose = false;
};

} // namespace prism
