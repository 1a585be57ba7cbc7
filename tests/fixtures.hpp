#pragma once

/// @file tests/fixtures.hpp
/// @brief Series builders shared by the unit and integration tests.

#include "prism/types.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace prism::testing {

/// Calendar day from y/m/d.
inline Date day(int y, unsigned m, unsigned d) {
    return Date{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

/// One observation per day starting at `start`.
inline Series daily(Date start, const std::vector<double>& values) {
    Series out;
    out.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        out.push_back({to_timestamp(start + std::chrono::days{static_cast<int>(i)}), values[i]});
    }
    return out;
}

/// `n` days of the same value starting at `start`.
inline Series flat(Date start, std::size_t n, double value) {
    return daily(start, std::vector<double>(n, value));
}

}  // namespace prism::testing
