/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_scan.cpp
 * @brief Micro-benchmarks for the maximum-subarray scan.
 *
 * Sweeps input sizes for the baseline, instrumented, wide and optimized
 * variants and fits the measurements to O(n). The per-distribution group
 * runs every generator at a fixed size.
 */

#include <benchmark/benchmark.h>
#include <kadane/kadane.h>
#include <cstdint>
#include <vector>

using namespace kadane;

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

std::vector<int32_t> makeInput(size_t size, Distribution dist = Distribution::RANDOM) {
    ArrayGenerator gen(DEFAULT_SEED);
    return gen.generate(size, dist);
}

} // namespace

// ============================================================================
// Size sweeps
// ============================================================================

static void BM_Scan_Baseline(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto values = makeInput(n);

    for (auto _ : state) {
        auto result = scan(values);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Scan_Baseline)->RangeMultiplier(10)->Range(100, 1000000)->Complexity(benchmark::oN);

static void BM_Scan_Instrumented(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto values = makeInput(n);
    MetricsCounter metrics;

    for (auto _ : state) {
        auto result = scan(values, metrics);
        benchmark::DoNotOptimize(result);
    }
    state.counters["comparisons"] = static_cast<double>(metrics.comparisons());
    state.counters["accesses"]    = static_cast<double>(metrics.elementAccesses());
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Scan_Instrumented)->RangeMultiplier(10)->Range(100, 1000000)->Complexity(benchmark::oN);

static void BM_Scan_Wide(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto values = makeInput(n);

    for (auto _ : state) {
        auto result = scan<int64_t>(values);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Scan_Wide)->RangeMultiplier(10)->Range(100, 1000000)->Complexity(benchmark::oN);

static void BM_Scan_Optimized(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto values = makeInput(n);

    for (auto _ : state) {
        auto result = scanOptimized(values);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Scan_Optimized)->RangeMultiplier(10)->Range(100, 1000000)->Complexity(benchmark::oN);

// Quadratic reference, kept small
static void BM_BruteForce(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto values = makeInput(n);

    for (auto _ : state) {
        auto result = bruteForce(values);
        benchmark::DoNotOptimize(result);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_BruteForce)->RangeMultiplier(2)->Range(64, 2048)->Complexity(benchmark::oNSquared);

// ============================================================================
// Distributions (fixed size)
// ============================================================================

static void BM_Scan_Distribution(benchmark::State& state, Distribution dist, bool optimized) {
    constexpr size_t n = 100000;
    const auto values = makeInput(n, dist);

    for (auto _ : state) {
        if (optimized) {
            auto result = scanOptimized<int64_t>(values);
            benchmark::DoNotOptimize(result);
        } else {
            auto result = scan<int64_t>(values);
            benchmark::DoNotOptimize(result);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK_CAPTURE(BM_Scan_Distribution, Random,         Distribution::RANDOM,          false)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, Sorted,         Distribution::SORTED,          false)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, ReverseSorted,  Distribution::REVERSE_SORTED,  false)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, AllPositive,    Distribution::ALL_POSITIVE,    false)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, AllNegative,    Distribution::ALL_NEGATIVE,    false)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, Alternating,    Distribution::ALTERNATING,     false)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, SparsePositive, Distribution::SPARSE_POSITIVE, false)->Unit(benchmark::kMicrosecond);

BENCHMARK_CAPTURE(BM_Scan_Distribution, Random_Optimized,         Distribution::RANDOM,          true)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, AllNegative_Optimized,    Distribution::ALL_NEGATIVE,    true)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Scan_Distribution, SparsePositive_Optimized, Distribution::SPARSE_POSITIVE, true)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
