#pragma once

/// @file include/prism/data_loader.hpp
/// @brief CSV loader for observation rows and reference prices.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files of observation rows into an `InMemorySource`.
/// Malformed, non-finite or negative rows are skipped; the loader never
/// crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// product_id,kind,timestamp,value
/// sku-1,competitor_price,2024-03-01,99.50
/// sku-1,units_sold,2024-03-01,42
/// sku-1,trend_score,2024-03-01T12:00:00Z,61
/// sku-1,reference_price,2024-03-01,104.99
/// ```
/// The first line is treated as a header and skipped. Kinds are
/// `competitor_price`, `units_sold`, `trend_score` and `reference_price`;
/// for a product with several `reference_price` rows the latest one wins.
///
/// ## Guarantees
/// - Bad input never throws; `load_csv` returns `nullopt` only when the
///   file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "prism/data_source.hpp"
#include "prism/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prism::core {

/// One parsed CSV data row.
struct CsvRow {
    std::string               product_id;
    std::optional<SeriesKind> series;  ///< `nullopt` for a reference_price row
    Timestamp                 time;
    double                    value = 0.0;
};

/// Loads observation rows from CSV files and strings.
class DataLoader {
public:
    /// Load a CSV file from disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - An empty source if the file has a header but no valid data rows
    [[nodiscard]] static std::optional<InMemorySource>
    load_csv(const std::string& filepath);

    /// Parse CSV content held in a string (first line is the header).
    [[nodiscard]] static InMemorySource parse_csv_string(std::string_view csv_content);

    /// Parse CSV content into rows without building a source.
    [[nodiscard]] static std::vector<CsvRow> parse_rows(std::string_view csv_content);

    /// Parse a single data row.
    /// Returns `nullopt` if the row is malformed, non-finite or negative.
    [[nodiscard]] static std::optional<CsvRow> parse_row(std::string_view line);
};

}  // namespace prism::core
