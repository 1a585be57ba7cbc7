#pragma once

/// @file include/prism/simulator.hpp
/// @brief Deterministic synthetic sales histories for demos, benchmarks and tests.
///
/// # Module: Sales Simulator
///
/// ## Model (per day, in order)
/// 1. base_demand · (1 + growth_rate · day)
/// 2. × month multiplier: Mar–Apr 1.00, May–Jun 1.15, Jul–Sep 0.85,
///      Oct–Nov 1.05, Dec–Feb 1.30
/// 3. × 1.20 on Saturday and Sunday
/// 4. offered price = base_price · U(0.92, 1.08);
///    demand × (price / base_price)^elasticity
/// 5. × max(0.1, N(1, 0.15))
/// 6. with probability 0.02, × U(1.5, 3.0)
/// 7. units = max(1, round(demand))
///
/// ## Guarantees
/// - Same seed and profile → identical output on the same standard library
///   (the distribution algorithms are implementation-defined)
/// - Both series are ascending, one row per day, ending at `end_date`

#include "prism/constants.hpp"
#include "prism/types.hpp"

#include <cstdint>
#include <random>
#include <string>

namespace prism {

/// Shape of one simulated product.
struct ProductProfile {
    std::string product_id  = "demo";
    double      base_price  = constants::FALLBACK_REFERENCE_PRICE;
    double      base_demand = 50.0;
    int         days        = 365;
    double      growth_rate = 0.0005;  ///< Daily linear growth (≈ 20% a year)
    double      elasticity  = constants::DEFAULT_ELASTICITY;
};

/// Simulated history for one product.
struct SimulatedHistory {
    Series sales;   ///< Units sold per day
    Series prices;  ///< Offered price per day
};

/// Demand multiplier for the month containing `d`.
[[nodiscard]] double seasonal_multiplier(Date d) noexcept;

class SalesSimulator {
public:
    explicit SalesSimulator(std::uint64_t seed = 42);

    /// Generate `profile.days` daily rows ending at `end_date`.
    [[nodiscard]] SimulatedHistory generate(const ProductProfile& profile, Date end_date);

private:
    std::mt19937_64 rng_;
};

}  // namespace prism
