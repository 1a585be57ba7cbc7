/// @file src/core/sales_simulator.cpp
/// @brief SalesSimulator.

#include "prism/simulator.hpp"

#include <algorithm>
#include <cmath>

namespace prism {

double seasonal_multiplier(Date d) noexcept {
    const unsigned month = static_cast<unsigned>(std::chrono::year_month_day{d}.month());
    switch (month) {
        case 3: case 4:         return 1.00;
        case 5: case 6:         return 1.15;
        case 7: case 8: case 9: return 0.85;
        case 10: case 11:       return 1.05;
        default:                return 1.30;  // Dec–Feb
    }
}

SalesSimulator::SalesSimulator(std::uint64_t seed)
    : rng_(seed) {}

SimulatedHistory SalesSimulator::generate(const ProductProfile& profile, Date end_date) {
    SimulatedHistory out;
    if (profile.days <= 0) {
        return out;
    }
    out.sales.reserve(static_cast<std::size_t>(profile.days));
    out.prices.reserve(static_cast<std::size_t>(profile.days));

    std::uniform_real_distribution<double> jitter(-0.08, 0.08);
    std::normal_distribution<double>       noise(1.0, 0.15);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> spike(1.5, 3.0);

    const Date start = end_date - std::chrono::days{profile.days - 1};

    for (int day = 0; day < profile.days; ++day) {
        const Date d = start + std::chrono::days{day};

        double demand = profile.base_demand * (1.0 + profile.growth_rate * day);
        demand *= seasonal_multiplier(d);
        if (is_weekend(d)) {
            demand *= 1.20;
        }

        const double price = profile.base_price * (1.0 + jitter(rng_));
        if (profile.base_price > 0.0) {
            demand *= std::pow(price / profile.base_price, profile.elasticity);
        }

        demand *= std::max(noise(rng_), 0.1);
        if (unit(rng_) < 0.02) {
            demand *= spike(rng_);
        }

        const double units = std::max(1.0, std::round(demand));
        out.sales.push_back(Observation{to_timestamp(d), units});
        out.prices.push_back(Observation{to_timestamp(d), std::round(price * 100.0) / 100.0});
    }
    return out;
}

}  // namespace prism
