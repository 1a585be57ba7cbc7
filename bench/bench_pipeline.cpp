/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the PRISM analytics stages.
 *
 * Benchmarks
 * ----------
 *   BM_Signals_Compute       - SignalEngine over N days of simulated rows
 *   BM_Forecast_HoltWinters  - 30-day forecast from N days of sales
 *   BM_Elasticity_Estimate   - log-log fit and 19-point curve
 *   BM_Engine_Analyze        - every stage through the Engine
 *   BM_DataLoader_ParseCsv   - CSV parsing, N days × 3 kinds
 *
 * Build (CMake):
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (observation days processed).
 */

#include "benchmark/benchmark.h"

#include "prism/data_loader.hpp"
#include "prism/engine.hpp"
#include "prism/simulator.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <string>

using namespace prism;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const Date kEndDate{std::chrono::year{2024} / 6 / 30};

/// Deterministic N-day history for one product.
static SimulatedHistory make_history(std::size_t days) {
    SalesSimulator sim(42);
    return sim.generate(ProductProfile{.product_id = "bench", .days = static_cast<int>(days)},
                        kEndDate);
}

static void set_items(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── Stages ─────────────────────────────────────────────────────────────────────

static void BM_Signals_Compute(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto h = make_history(n);
    const signals::SignalEngine engine;
    const Timestamp at = to_timestamp(kEndDate);

    for (auto _ : state) {
        auto set = engine.compute("bench", 100.0, h.prices, h.sales, h.sales, at);
        benchmark::DoNotOptimize(set);
    }
    set_items(state, n);
}
BENCHMARK(BM_Signals_Compute)->RangeMultiplier(2)->Range(30, 720)->Unit(benchmark::kMicrosecond);

static void BM_Forecast_HoltWinters(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto h = make_history(n);
    const forecast::DemandForecaster forecaster;

    for (auto _ : state) {
        auto f = forecaster.forecast("bench", h.sales, 50.0, 30);
        benchmark::DoNotOptimize(f);
    }
    set_items(state, n);
}
BENCHMARK(BM_Forecast_HoltWinters)->RangeMultiplier(2)->Range(30, 720)->Unit(benchmark::kMicrosecond);

static void BM_Elasticity_Estimate(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto h = make_history(n);
    const elasticity::ElasticityEstimator estimator;

    for (auto _ : state) {
        auto e = estimator.estimate(100.0, h.prices, h.sales);
        benchmark::DoNotOptimize(e);
    }
    set_items(state, n);
}
BENCHMARK(BM_Elasticity_Estimate)->RangeMultiplier(2)->Range(30, 720)->Unit(benchmark::kMicrosecond);

static void BM_Engine_Analyze(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto h = make_history(n);

    InMemorySource source;
    source.set_series("bench", SeriesKind::UnitsSold, h.sales);
    source.set_series("bench", SeriesKind::CompetitorPrice, h.prices);
    source.set_reference_price("bench", 100.0);
    const core::Engine engine(source, AnalyticsConfig{}, to_timestamp(kEndDate));

    for (auto _ : state) {
        auto report = engine.analyze("bench", 14);
        benchmark::DoNotOptimize(report);
    }
    set_items(state, n);
}
BENCHMARK(BM_Engine_Analyze)->RangeMultiplier(2)->Range(30, 720)->Unit(benchmark::kMicrosecond);

static void BM_DataLoader_ParseCsv(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto h = make_history(n);

    std::string csv = "product_id,kind,timestamp,value\n";
    for (std::size_t i = 0; i < n; ++i) {
        const std::string date = format_date(to_date(h.sales[i].time));
        csv += fmt::format("bench,units_sold,{},{}\n", date, h.sales[i].value);
        csv += fmt::format("bench,competitor_price,{},{:.2f}\n", date, h.prices[i].value);
        csv += fmt::format("bench,trend_score,{},50\n", date);
    }

    for (auto _ : state) {
        auto source = core::DataLoader::parse_csv_string(csv);
        benchmark::DoNotOptimize(source);
    }
    set_items(state, n);
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(csv.size()));
}
BENCHMARK(BM_DataLoader_ParseCsv)->RangeMultiplier(2)->Range(30, 720)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
