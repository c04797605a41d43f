/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file benchmark_runner.h
 * @brief Benchmark orchestration over the size x distribution matrix.
 *
 * Phases of run():
 *   1. warmup      warmup sizes x warmup iterations on random input, history cleared afterwards
 *   2. suite       every (size, distribution, algorithm) configuration, measured iterations each;
 *                  every result is validated, every run recorded
 *   3. export      details / scaling / runs / summary / complexity CSVs (optional)
 *   4. report      summary table and complexity analysis on the log stream
 *
 * Measurements use the 64-bit accumulator so that large sorted inputs report
 * their true maximum. Optimized runs are timed around the call; their operation
 * counters stay zero.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "array_generator.h"
#include "definitions.h"
#include "metrics.h"
#include "run_history.h"

namespace kadane {

    enum class AlgorithmSelection : uint8_t {
        BASELINE  = 0,
        OPTIMIZED = 1,
        BOTH      = 2
    };

    constexpr std::string_view toString(AlgorithmSelection selection) {
        switch (selection) {
            case AlgorithmSelection::BASELINE:  return "baseline";
            case AlgorithmSelection::OPTIMIZED: return "optimized";
            case AlgorithmSelection::BOTH:      return "both";
        }
        return "unknown";
    }

    /// Parse "baseline", "optimized" or "both". Throws ConfigurationError.
    AlgorithmSelection algorithmSelectionFromString(std::string_view label);

    struct BenchmarkConfig {
        std::vector<size_t>         sizes               = {DEFAULT_SIZES.begin(), DEFAULT_SIZES.end()};
        std::vector<Distribution>   distributions       = {DEFAULT_DISTRIBUTIONS.begin(), DEFAULT_DISTRIBUTIONS.end()};
        size_t                      warmupIterations    = DEFAULT_WARMUP_ITERATIONS;
        size_t                      iterations          = DEFAULT_ITERATIONS;
        AlgorithmSelection          algorithm           = AlgorithmSelection::BASELINE;
        uint32_t                    seed                = DEFAULT_SEED;
        std::filesystem::path       outputDir           = ".";
        bool                        exportCsv           = true;
        bool                        verbose             = false;
    };

    /// Throws ConfigurationError on empty lists, zero sizes or zero measured iterations.
    void validateConfig(const BenchmarkConfig& config);

    /**
     * @brief Statistics of one (algorithm, size, distribution) configuration.
     */
    struct ConfigurationResult {
        std::string     algorithm;
        size_t          size                = 0;
        std::string     distribution;
        size_t          iterations          = 0;
        double          avgTimeMs           = 0.0;
        double          minTimeMs           = 0.0;
        double          maxTimeMs           = 0.0;
        double          stdDevMs            = 0.0;
        double          avgComparisons      = 0.0;
        double          avgElementAccesses  = 0.0;
    };

    /**
     * @brief Per-size aggregate across distributions.
     */
    struct ScalingRow {
        size_t  size                = 0;
        double  avgTimeMs           = 0.0;     // mean of the configuration means
        double  minTimeMs           = 0.0;
        double  maxTimeMs           = 0.0;
        double  timePerElementNs    = 0.0;
    };

    inline const std::vector<std::string> DETAILS_CSV_COLUMNS = {
        "size", "distribution", "avg_time_ms", "min_time_ms", "max_time_ms",
        "std_dev_ms", "avg_comparisons", "avg_array_accesses"
    };

    inline const std::vector<std::string> SCALING_CSV_COLUMNS = {
        "size", "avg_time_all_dists_ms", "min_time_ms", "max_time_ms", "time_per_element_ns"
    };

    /// Results of one algorithm, grouped by size (ascending).
    std::vector<ScalingRow> scalingRows(std::span<const ConfigurationResult> results);

    void    writeDetailsCsv(std::ostream& os, std::span<const ConfigurationResult> results);
    void    writeScalingCsv(std::ostream& os, std::span<const ConfigurationResult> results);

    class BenchmarkRunner {
        BenchmarkConfig             config_;
        std::unique_ptr<RunHistory> owned_history_;     // set when no history is injected
        RunHistory&                 history_;
        RunRecorder                 baseline_;
        RunRecorder                 optimized_;
        ArrayGenerator              generator_;
        MetricsCounter              metrics_;
        std::ostream&               log_;

    public:
        explicit BenchmarkRunner(BenchmarkConfig config, std::ostream& log = std::cerr);
        BenchmarkRunner(BenchmarkConfig config, RunHistory& history, std::ostream& log = std::cerr);
        BenchmarkRunner(const BenchmarkRunner&) = delete;
        BenchmarkRunner& operator=(const BenchmarkRunner&) = delete;

        const BenchmarkConfig&              config() const      { return config_; }
        RunHistory&                         history()           { return history_; }
        const RunHistory&                   history() const     { return history_; }

        std::vector<ConfigurationResult>    run();
        void                                runWarmup();
        std::vector<ConfigurationResult>    runSuite();
        std::vector<RunRecord>              runBatch(const std::vector<std::vector<int32_t>>& arrays,
                                                     const std::vector<std::string>& labels);
        std::vector<std::filesystem::path>  exportResults(const std::vector<ConfigurationResult>& results);

        void    printConfiguration(std::ostream& os) const;
        void    printSummary(const std::vector<ConfigurationResult>& results, std::ostream& os) const;
        void    printComplexityAnalysis(const std::vector<ConfigurationResult>& results, std::ostream& os) const;

    private:
        std::vector<const char*>            selectedAlgorithms() const;
        RunRecord                           measure(std::span<const int32_t> values, const char* algorithm,
                                                    const std::string& label);
    };

} // namespace kadane
