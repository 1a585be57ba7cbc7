#pragma once

/// @file include/prism/types.hpp
/// @brief Shared value types for the PRISM pricing-intelligence pipeline.
///
/// Every module includes this file. It defines observation series, the
/// calendar helpers used to key them by day, and the `Outcome<T>` wrapper
/// that carries a quality tag alongside each analytics result.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace prism {

// ─── Time ─────────────────────────────────────────────────────────────────────

/// Observation timestamp, UTC, second resolution.
using Timestamp = std::chrono::sys_seconds;

/// Calendar day (UTC).
using Date = std::chrono::sys_days;

// ─── Observation Series ───────────────────────────────────────────────────────

/// The three observation streams the pipeline consumes.
enum class SeriesKind {
    CompetitorPrice,  ///< Competitor price quotes for the product
    UnitsSold,        ///< Daily unit sales
    TrendScore,       ///< Search-trend interest score (0–100)
};

/// Canonical snake_case name ("competitor_price", "units_sold", "trend_score").
[[nodiscard]] const char* to_string(SeriesKind kind) noexcept;

/// Parse a canonical kind name. Returns `nullopt` for unknown names.
[[nodiscard]] std::optional<SeriesKind> parse_series_kind(std::string_view name) noexcept;

/// A single `(timestamp, value)` observation.
struct Observation {
    Timestamp time;   ///< When the value was recorded
    double    value;  ///< Non-negative observed value
};

/// Observations of one kind for one product.
using Series = std::vector<Observation>;

/// Sort ascending by time and drop non-finite or negative values.
[[nodiscard]] Series normalize_series(Series series);

/// The last `limit` observations of an ascending series.
[[nodiscard]] Series most_recent(const Series& ascending, std::size_t limit);

/// Plain values of a series, in order.
[[nodiscard]] std::vector<double> values_of(const Series& series);

// ─── Calendar Helpers ─────────────────────────────────────────────────────────

/// Calendar day containing `t`.
[[nodiscard]] Date to_date(Timestamp t) noexcept;

/// Midnight UTC at the start of `d`.
[[nodiscard]] Timestamp to_timestamp(Date d) noexcept;

/// True for Saturday and Sunday.
[[nodiscard]] bool is_weekend(Date d) noexcept;

/// ISO-8601 day, e.g. "2024-03-09".
[[nodiscard]] std::string format_date(Date d);

/// ISO-8601 UTC timestamp, e.g. "2024-03-09T14:05:00Z".
[[nodiscard]] std::string format_timestamp(Timestamp t);

/// English weekday name ("Monday" … "Sunday").
[[nodiscard]] const char* weekday_name(Date d) noexcept;

/// Parse `YYYY-MM-DD` or `YYYY-MM-DDTHH:MM:SS[Z]` (a space may replace `T`).
/// Returns `nullopt` on malformed or out-of-range input.
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept;

// ─── Result Quality ───────────────────────────────────────────────────────────

/// How much a result can be trusted.
enum class Quality {
    Ok,        ///< Computed normally from sufficient data
    Degraded,  ///< Valid value, computed on thin data or through a fallback
    Empty,     ///< No data at all; the value is the documented neutral default
};

[[nodiscard]] const char* to_string(Quality q) noexcept;

/// Worse of two quality tags (Empty > Degraded > Ok).
[[nodiscard]] constexpr Quality worst(Quality a, Quality b) noexcept {
    return static_cast<int>(a) > static_cast<int>(b) ? a : b;
}

/// An analytics value tagged with its quality.
///
/// Components never throw for thin or missing data; they return an Outcome
/// whose `quality` says whether the value was computed normally, through a
/// documented fallback, or is a neutral default for an empty input.
template <typename T>
struct Outcome {
    T           value;
    Quality     quality = Quality::Ok;
    std::string reason;  ///< Empty when quality is Ok

    [[nodiscard]] static Outcome ok(T v) {
        return Outcome{std::move(v), Quality::Ok, {}};
    }
    [[nodiscard]] static Outcome degraded(T v, std::string why) {
        return Outcome{std::move(v), Quality::Degraded, std::move(why)};
    }
    [[nodiscard]] static Outcome empty(T v, std::string why) {
        return Outcome{std::move(v), Quality::Empty, std::move(why)};
    }

    [[nodiscard]] bool is_ok() const noexcept       { return quality == Quality::Ok; }
    [[nodiscard]] bool is_degraded() const noexcept { return quality == Quality::Degraded; }
    [[nodiscard]] bool is_empty() const noexcept    { return quality == Quality::Empty; }

    const T* operator->() const noexcept { return &value; }
    const T& operator*() const noexcept  { return value; }
};

} // namespace prism
