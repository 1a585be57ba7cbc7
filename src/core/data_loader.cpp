/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for observation rows.

#include "prism/data_loader.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>

namespace prism::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<double> parse_number(std::string_view token) noexcept {
    double value = 0.0;
    const char* first = token.data();
    const char* last  = first + token.size();
    if (first != last && *first == '+') {
        ++first;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;  // unparsable or trailing garbage
    }
    return value;
}

}  // namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<CsvRow> DataLoader::parse_row(std::string_view line) {
    // Skip blank lines and comment lines.
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::array<std::string_view, 4> fields{};
    std::size_t count = 0;
    while (true) {
        const auto comma = line.find(',');
        if (count == fields.size()) {
            return std::nullopt;  // too many columns
        }
        fields[count++] = trim(line.substr(0, comma));
        if (comma == std::string_view::npos) {
            break;
        }
        line.remove_prefix(comma + 1);
    }
    if (count != fields.size()) {
        return std::nullopt;
    }

    const auto& [id, kind, stamp, number] = fields;
    if (id.empty()) {
        return std::nullopt;
    }

    std::optional<SeriesKind> series = parse_series_kind(kind);
    if (!series && kind != "reference_price") {
        return std::nullopt;
    }

    const auto time  = parse_timestamp(stamp);
    const auto value = parse_number(number);
    if (!time || !value || !std::isfinite(*value) || *value < 0.0) {
        return std::nullopt;
    }

    return CsvRow{std::string(id), series, *time, *value};
}

// ─── DataLoader::parse_rows ───────────────────────────────────────────────────

std::vector<CsvRow> DataLoader::parse_rows(std::string_view csv_content) {
    std::vector<CsvRow> rows;
    bool header_skipped = false;

    while (!csv_content.empty()) {
        const auto eol = csv_content.find('\n');
        const std::string_view line = trim(csv_content.substr(0, eol));
        csv_content.remove_prefix(eol == std::string_view::npos ? csv_content.size() : eol + 1);

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto row = parse_row(line)) {
            rows.push_back(std::move(*row));
        }
    }
    return rows;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

InMemorySource DataLoader::parse_csv_string(std::string_view csv_content) {
    InMemorySource source;
    std::map<std::string, std::pair<Timestamp, double>> latest_price;

    for (auto& row : parse_rows(csv_content)) {
        if (row.series) {
            source.add(row.product_id, *row.series, Observation{row.time, row.value});
            continue;
        }
        const auto it = latest_price.find(row.product_id);
        if (it == latest_price.end() || row.time >= it->second.first) {
            latest_price[row.product_id] = {row.time, row.value};
        }
    }

    for (const auto& [id, entry] : latest_price) {
        source.set_reference_price(id, entry.second);
    }
    return source;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<InMemorySource> DataLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace prism::core
