#pragma once

/// @file include/prism/data_source.hpp
/// @brief SeriesSource - the row collaborator the pipeline reads from.
///
/// # Module: Data Source
///
/// ## Responsibility
/// Abstract the store that holds observation rows and reference prices, so
/// the pipeline runs unchanged against a live store, a CSV file or a test
/// fixture.
///
/// ## Contract
/// - `fetch_series` returns the `limit` most recent observations in
///   `[since, until]`, in ascending time order. Rows after `until` never
///   count towards `limit`. No data is an empty series, not an error.
/// - `fetch_reference_price` returns `nullopt` when the product has none.
/// - An implementation may throw a `std::exception` for a transport failure;
///   the Engine treats that as an empty series.

#include "prism/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prism {

class SeriesSource {
public:
    virtual ~SeriesSource() = default;

    [[nodiscard]] virtual Series fetch_series(const std::string& product_id,
                                              SeriesKind kind,
                                              Timestamp since,
                                              Timestamp until,
                                              std::size_t limit) const = 0;

    [[nodiscard]] virtual std::optional<double>
    fetch_reference_price(const std::string& product_id) const = 0;
};

/// Earliest representable timestamp; `since` for "no lower bound".
[[nodiscard]] Timestamp beginning_of_time() noexcept;

/// Latest representable timestamp; `until` for "no upper bound".
[[nodiscard]] Timestamp end_of_time() noexcept;

// ─── InMemorySource ───────────────────────────────────────────────────────────

/// SeriesSource over rows held in memory (CSV loads, fixtures, simulations).
class InMemorySource final : public SeriesSource {
public:
    /// Append one observation.
    void add(const std::string& product_id, SeriesKind kind, Observation obs);

    /// Replace a product's series of one kind.
    void set_series(const std::string& product_id, SeriesKind kind, Series series);

    void set_reference_price(const std::string& product_id, double price);

    /// Every product with at least one row or a reference price, sorted.
    [[nodiscard]] std::vector<std::string> products() const;

    /// Total number of observations held.
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] Series fetch_series(const std::string& product_id,
                                      SeriesKind kind,
                                      Timestamp since,
                                      Timestamp until,
                                      std::size_t limit) const override;

    [[nodiscard]] std::optional<double>
    fetch_reference_price(const std::string& product_id) const override;

private:
    std::map<std::pair<std::string, SeriesKind>, Series> series_;
    std::map<std::string, double>                        reference_prices_;
};

}  // namespace prism
