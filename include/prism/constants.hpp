#pragma once

#include <cstddef>

/// @file include/prism/constants.hpp
/// @brief Default thresholds, windows and smoothing parameters for PRISM.
///
/// Every value here is a default only. Components read their parameters from
/// an AnalyticsConfig (see config.hpp) whose fields are initialised from
/// these constants.

namespace prism::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Below this |n·Σx² − (Σx)²| the regression design is treated as singular.
static constexpr double OLS_DEGENERATE_EPSILON = 1e-10;

/// Minimum number of points for a regression fit.
static constexpr std::size_t OLS_MIN_POINTS = 3;

// ─── Collaborator Defaults ────────────────────────────────────────────────────

/// Reference price used when the collaborator has none for a product.
static constexpr double FALLBACK_REFERENCE_PRICE = 100.0;

/// Trend score used as a neutral demand amplifier when none is observed.
static constexpr double NEUTRAL_TREND_SCORE = 50.0;

/// Average daily demand assumed by the optimizer when no recent sales exist.
static constexpr double FALLBACK_AVERAGE_DEMAND = 50.0;

// ─── Signal Windows ───────────────────────────────────────────────────────────

static constexpr std::size_t PRICE_WINDOW           = 200;
static constexpr std::size_t DEMAND_WINDOW          = 60;
static constexpr std::size_t TREND_WINDOW           = 20;
static constexpr std::size_t ELASTICITY_PRICE_WINDOW  = 50;
static constexpr std::size_t ELASTICITY_DEMAND_WINDOW = 200;

/// Days, back from the evaluation time, covered by the demand and
/// elasticity signal fetches.
static constexpr int DEMAND_SIGNAL_DAYS     = 30;
static constexpr int ELASTICITY_SIGNAL_DAYS = 90;

/// Moving-average length for the demand block (one week of daily rows).
static constexpr std::size_t MOVING_AVERAGE_DAYS = 7;

// ─── Signal Classification Thresholds ─────────────────────────────────────────

static constexpr double VOLATILITY_LOW        = 0.05;
static constexpr double VOLATILITY_MEDIUM     = 0.15;
static constexpr double GROWTH_LABEL_BAND     = 0.05;
static constexpr double MOMENTUM_LABEL_BAND   = 5.0;
static constexpr double CORRELATION_LOW       = 0.3;
static constexpr double CORRELATION_MEDIUM    = 0.6;

/// Minimum points for the correlation-based elasticity signal.
static constexpr std::size_t ELASTICITY_SIGNAL_MIN_DEMAND = 4;
static constexpr std::size_t ELASTICITY_SIGNAL_MIN_PRICES = 2;

// ─── Holt-Winters Defaults ────────────────────────────────────────────────────

static constexpr double      HW_ALPHA         = 0.3;
static constexpr double      HW_BETA          = 0.1;
static constexpr double      HW_GAMMA         = 0.2;
static constexpr std::size_t HW_SEASON_LENGTH = 7;

static constexpr int MIN_HORIZON_DAYS     = 7;
static constexpr int MAX_HORIZON_DAYS     = 30;
static constexpr int DEFAULT_HORIZON_DAYS = 14;

/// z-value of the two-sided 95% normal interval.
static constexpr double CONFIDENCE_Z = 1.96;

/// Sales history fetched for a forecast (days back, max rows).
static constexpr int         FORECAST_HISTORY_DAYS = 180;
static constexpr std::size_t FORECAST_HISTORY_ROWS = 500;

/// Trailing observations averaged for the forecast noise ratio.
static constexpr std::size_t FORECAST_RECENT_WINDOW = 14;

// ─── Elasticity Defaults ──────────────────────────────────────────────────────

static constexpr std::size_t ELASTICITY_MIN_MATCHED_PAIRS = 10;
static constexpr std::size_t ELASTICITY_MIN_PAIRS         = 5;
static constexpr double      DEFAULT_ELASTICITY           = -1.2;
static constexpr double      DEFAULT_CROSS_ELASTICITY     = 0.3;
static constexpr double      DEFAULT_PRICE_BAND           = 0.15;
static constexpr double      CROSS_ELASTICITY_FACTOR      = 0.25;

/// Elasticity history fetched (days back) and row limits.
static constexpr int         ELASTICITY_HISTORY_DAYS  = 180;
static constexpr std::size_t ELASTICITY_SALES_ROWS    = 400;
static constexpr std::size_t ELASTICITY_PRICE_ROWS    = 200;

/// Curve sweep, in percent of the reference price (inclusive bounds).
static constexpr int CURVE_MIN_PCT  = 60;
static constexpr int CURVE_MAX_PCT  = 150;
static constexpr int CURVE_STEP_PCT = 5;

// ─── Optimizer Defaults ───────────────────────────────────────────────────────

static constexpr int         DAYS_PER_MONTH          = 30;
static constexpr int         RECENT_DEMAND_DAYS      = 14;
static constexpr std::size_t COMPETITOR_AVG_ROWS     = 50;
static constexpr double      FULL_CONFIDENCE_POINTS  = 50.0;
static constexpr double      MIN_OPT_CONFIDENCE      = 0.5;
static constexpr double      MAX_OPT_CONFIDENCE      = 0.98;

/// Reported competitor average when none is observed: current × this.
static constexpr double MISSING_COMPETITOR_MARKUP = 1.05;

// ─── Decision Defaults ────────────────────────────────────────────────────────

static constexpr int HOLD_CONFIDENCE = 92;

} // namespace prism::constants
