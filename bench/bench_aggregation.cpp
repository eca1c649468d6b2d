/**
 * @file  bench/bench_aggregation.cpp
 * @brief Google Benchmark suite for Krylov aggregation.
 *
 * Benchmarks
 * ----------
 *   BM_ExactStep             — one sparse F·p product (the baseline)
 *   BM_EngineStep            — one aggregated Π·π product
 *   BM_InstrumentedStep      — engine + exact chain + error measurement
 *   BM_ArnoldiExpand         — growing a basis to k vectors
 *   BM_AdaptiveSelect        — full checkpointed size search
 *
 * Build (CMake):
 *   cmake -DKAGG_BUILD_BENCH=ON ..
 *   cmake --build build --target kagg_bench
 *   ./build/kagg_bench --benchmark_format=json
 *
 * Throughput units: items/second (time steps or basis vectors).
 */

#include "benchmark/benchmark.h"

#include "kagg/aggregation.hpp"
#include "kagg/krylov.hpp"
#include "kagg/sizing.hpp"
#include "support/test_chains.hpp"

#include <cstdint>

using namespace kagg;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Schedule small enough that the search finishes within a benchmark iteration.
static sizing::SizingConfig bench_config() {
    sizing::SizingConfig config;
    config.tolerance   = 1e-10;
    config.checkpoints = sizing::SizingConfig::linear_schedule(1, 5, 20);
    config.size_cap    = 100;
    return config;
}

// ── Stepping ───────────────────────────────────────────────────────────────────

static void BM_ExactStep(benchmark::State& state) {
    const Index n     = static_cast<Index>(state.range(0));
    const auto  chain = fixtures::birth_death_chain(n);
    Vector p    = fixtures::random_distribution(n, 1);
    Vector next(n);
    for (auto _ : state) {
        chain.apply(p, next);
        p.swap(next);
        benchmark::DoNotOptimize(p.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ExactStep)->RangeMultiplier(4)->Range(256, 262144)->Unit(benchmark::kMicrosecond);

static void BM_EngineStep(benchmark::State& state) {
    const Index k     = static_cast<Index>(state.range(0));
    const auto  chain = fixtures::birth_death_chain(4 * k);
    aggregation::AggregationEngine engine(chain, fixtures::random_distribution(4 * k, 2),
                                          sizing::naive_arnoldi(k));
    for (auto _ : state) {
        engine.step();
        benchmark::DoNotOptimize(engine.state().data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
    state.counters["k"] = static_cast<double>(engine.size());
}
BENCHMARK(BM_EngineStep)->RangeMultiplier(2)->Range(4, 256);

static void BM_InstrumentedStep(benchmark::State& state) {
    const Index n     = static_cast<Index>(state.range(0));
    const auto  chain = fixtures::birth_death_chain(n);
    aggregation::ErrorInstrumentation probe(chain, fixtures::random_distribution(n, 3),
                                            sizing::arnoldi_with_stationary(16));
    for (auto _ : state) {
        probe.measure_dynamic_error();
        benchmark::DoNotOptimize(probe.dynamic_error());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_InstrumentedStep)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Construction ───────────────────────────────────────────────────────────────

static void BM_ArnoldiExpand(benchmark::State& state) {
    const Index k     = static_cast<Index>(state.range(0));
    const Index n     = 8192;
    const auto  chain = fixtures::birth_death_chain(n);
    const Vector p0   = fixtures::random_distribution(n, 4);
    for (auto _ : state) {
        krylov::ArnoldiFactorization fact(chain, p0, k);
        while (fact.size() < k && fact.expand() == krylov::ExpandStatus::Expanded) {
        }
        benchmark::DoNotOptimize(fact.residual_norm());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(k));
}
BENCHMARK(BM_ArnoldiExpand)->RangeMultiplier(2)->Range(8, 128)->Unit(benchmark::kMillisecond);

static void BM_AdaptiveSelect(benchmark::State& state) {
    const Index n     = static_cast<Index>(state.range(0));
    const auto  chain = fixtures::birth_death_chain(n);
    const Vector p0   = fixtures::random_distribution(n, 5);
    const sizing::AdaptiveSizeSelector selector(bench_config());
    Index size = 0;
    for (auto _ : state) {
        const auto result = selector.select(chain, p0);
        size = result.aggregation.size();
        benchmark::DoNotOptimize(size);
    }
    state.counters["k"] = static_cast<double>(size);
}
BENCHMARK(BM_AdaptiveSelect)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
