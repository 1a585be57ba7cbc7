/// @file src/core/data_source.cpp
/// @brief InMemorySource.

#include "prism/data_source.hpp"

#include <algorithm>
#include <set>

namespace prism {

Timestamp beginning_of_time() noexcept {
    // Year 1 keeps date arithmetic on the result well inside range.
    return to_timestamp(std::chrono::sys_days{std::chrono::year{1} / 1 / 1});
}

Timestamp end_of_time() noexcept {
    return to_timestamp(std::chrono::sys_days{std::chrono::year{9999} / 12 / 31});
}

void InMemorySource::add(const std::string& product_id, SeriesKind kind, Observation obs) {
    series_[{product_id, kind}].push_back(obs);
}

void InMemorySource::set_series(const std::string& product_id, SeriesKind kind, Series series) {
    series_[{product_id, kind}] = std::move(series);
}

void InMemorySource::set_reference_price(const std::string& product_id, double price) {
    reference_prices_[product_id] = price;
}

std::vector<std::string> InMemorySource::products() const {
    std::set<std::string> ids;
    for (const auto& [key, rows] : series_) {
        if (!rows.empty()) {
            ids.insert(key.first);
        }
    }
    for (const auto& [id, price] : reference_prices_) {
        ids.insert(id);
    }
    return {ids.begin(), ids.end()};
}

std::size_t InMemorySource::size() const noexcept {
    std::size_t n = 0;
    for (const auto& [key, rows] : series_) {
        n += rows.size();
    }
    return n;
}

Series InMemorySource::fetch_series(const std::string& product_id,
                                    SeriesKind kind,
                                    Timestamp since,
                                    Timestamp until,
                                    std::size_t limit) const {
    const auto it = series_.find({product_id, kind});
    if (it == series_.end()) {
        return {};
    }

    Series rows = normalize_series(it->second);
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [since, until](const Observation& o) {
                                  return o.time < since || o.time > until;
                              }),
               rows.end());
    return most_recent(rows, limit);
}

std::optional<double> InMemorySource::fetch_reference_price(const std::string& product_id) const {
    const auto it = reference_prices_.find(product_id);
    if (it == reference_prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace prism
