/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV loader feeding the full Engine.
 *
 * Build:
 *   cmake -DPRISM_BUILD_FUZZERS=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every loaded observation is finite and non-negative.
 *   3. Every loaded reference price is finite and non-negative.
 *   4. Analysing the first loaded product yields six audit entries and a
 *      non-empty recommendation list; finite forecast bands satisfy
 *      0 ≤ lower ≤ point ≤ upper.
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view. The parser must handle
 *   binary garbage, missing or extra columns, "nan"/"inf" tokens, exponent
 *   notation, malformed timestamps and CR/LF mixes.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <string_view>

#include "prism/data_loader.hpp"
#include "prism/engine.hpp"

using namespace prism;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto source   = core::DataLoader::parse_csv_string(input);
    const auto products = source.products();

    for (const auto& id : products) {
        for (const auto kind : {SeriesKind::CompetitorPrice, SeriesKind::UnitsSold,
                                SeriesKind::TrendScore}) {
            for (const auto& o : source.fetch_series(id, kind, beginning_of_time(), end_of_time(), 1000)) {
                // Invariant 2
                assert(std::isfinite(o.value));
                assert(o.value >= 0.0);
            }
        }
        if (const auto price = source.fetch_reference_price(id)) {
            // Invariant 3
            assert(std::isfinite(*price));
            assert(*price >= 0.0);
        }
    }

    if (products.empty()) {
        return 0;
    }

    const Timestamp as_of{std::chrono::sys_days{std::chrono::year{2030} / 1 / 1}};
    const core::Engine engine(source, AnalyticsConfig{}, as_of);
    const auto report = engine.analyze(products.front());

    // Invariant 4
    assert(report.decision->log.size() == decision::kAllRules.size());
    assert(!report.decision->recommendations.empty());
    for (const auto& p : report.forecast->predictions) {
        // Values near DBL_MAX overflow the projection; only finite bands are ordered.
        if (!std::isfinite(p.upper_bound)) {
            continue;
        }
        assert(p.lower_bound >= 0.0);
        assert(p.lower_bound <= p.point_estimate);
        assert(p.point_estimate <= p.upper_bound);
    }
    return 0;
}
