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
 * @file benchmark_runner.hpp
 * @brief BenchmarkRunner implementations.
 */

#include "benchmark_runner.h"
#include "array_generator.hpp"
#include "csv_export.hpp"
#include "csv_writer.hpp"
#include "max_subarray.hpp"
#include "metrics.hpp"
#include "run_history.hpp"
#include "statistics.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>

namespace kadane {

    inline AlgorithmSelection algorithmSelectionFromString(std::string_view label) {
        for (auto s : {AlgorithmSelection::BASELINE, AlgorithmSelection::OPTIMIZED, AlgorithmSelection::BOTH}) {
            if (toString(s) == label) {
                return s;
            }
        }
        throw ConfigurationError("Unknown algorithm '" + std::string(label) +
                                 "'. Expected 'baseline', 'optimized' or 'both'.");
    }

    inline void validateConfig(const BenchmarkConfig& config) {
        if (config.sizes.empty()) {
            throw ConfigurationError("At least one input size is required.");
        }
        for (size_t size : config.sizes) {
            if (size == 0) {
                throw ConfigurationError("Input sizes must be positive.");
            }
        }
        if (config.distributions.empty()) {
            throw ConfigurationError("At least one distribution is required.");
        }
        if (config.iterations == 0) {
            throw ConfigurationError("Measured iterations must be positive.");
        }
    }

    // ========================================================================
    // Result tables
    // ========================================================================

    inline std::vector<ScalingRow> scalingRows(std::span<const ConfigurationResult> results) {
        std::map<size_t, std::vector<const ConfigurationResult*>> bySize;
        for (const auto& r : results) {
            bySize[r.size].push_back(&r);
        }

        std::vector<ScalingRow> rows;
        rows.reserve(bySize.size());
        for (const auto& [size, group] : bySize) {
            ScalingRow row;
            row.size      = size;
            row.minTimeMs = group.front()->minTimeMs;
            row.maxTimeMs = group.front()->maxTimeMs;
            double sum = 0.0;
            for (const auto* r : group) {
                sum += r->avgTimeMs;
                row.minTimeMs = std::min(row.minTimeMs, r->minTimeMs);
                row.maxTimeMs = std::max(row.maxTimeMs, r->maxTimeMs);
            }
            row.avgTimeMs        = sum / static_cast<double>(group.size());
            row.timePerElementNs = row.avgTimeMs * 1e6 / static_cast<double>(size);
            rows.push_back(row);
        }
        return rows;
    }

    namespace detail {

        inline std::vector<ConfigurationResult> resultsFor(const std::vector<ConfigurationResult>& results,
                                                           const std::string& algorithm) {
            std::vector<ConfigurationResult> out;
            std::copy_if(results.begin(), results.end(), std::back_inserter(out),
                         [&](const ConfigurationResult& r) { return r.algorithm == algorithm; });
            return out;
        }

        inline std::string algorithmTag(const std::string& algorithm) {
            return algorithm == ALGORITHM_OPTIMIZED ? "optimized" : "baseline";
        }

        inline void writeDetails(CsvWriter& writer, std::span<const ConfigurationResult> results) {
            for (const auto& r : results) {
                writer.writeRow({
                    static_cast<uint64_t>(r.size),
                    r.distribution,
                    r.avgTimeMs,
                    r.minTimeMs,
                    r.maxTimeMs,
                    r.stdDevMs,
                    r.avgComparisons,
                    r.avgElementAccesses
                });
            }
        }

        inline void writeScaling(CsvWriter& writer, std::span<const ConfigurationResult> results) {
            for (const auto& row : scalingRows(results)) {
                writer.writeRow({
                    static_cast<uint64_t>(row.size),
                    row.avgTimeMs,
                    row.minTimeMs,
                    row.maxTimeMs,
                    row.timePerElementNs
                });
            }
        }

    } // namespace detail

    inline void writeDetailsCsv(std::ostream& os, std::span<const ConfigurationResult> results) {
        CsvWriter writer(DETAILS_CSV_COLUMNS);
        writer.open(os);
        detail::writeDetails(writer, results);
        writer.close();
    }

    inline void writeScalingCsv(std::ostream& os, std::span<const ConfigurationResult> results) {
        CsvWriter writer(SCALING_CSV_COLUMNS);
        writer.open(os);
        detail::writeScaling(writer, results);
        writer.close();
    }

    // ========================================================================
    // BenchmarkRunner
    // ========================================================================

    inline BenchmarkRunner::BenchmarkRunner(BenchmarkConfig config, std::ostream& log)
        : config_(std::move(config))
        , owned_history_(std::make_unique<RunHistory>())
        , history_(*owned_history_)
        , baseline_(history_, ALGORITHM_BASELINE)
        , optimized_(history_, ALGORITHM_OPTIMIZED)
        , generator_(config_.seed)
        , log_(log)
    {
    }

    inline BenchmarkRunner::BenchmarkRunner(BenchmarkConfig config, RunHistory& history, std::ostream& log)
        : config_(std::move(config))
        , history_(history)
        , baseline_(history_, ALGORITHM_BASELINE)
        , optimized_(history_, ALGORITHM_OPTIMIZED)
        , generator_(config_.seed)
        , log_(log)
    {
    }

    inline std::vector<const char*> BenchmarkRunner::selectedAlgorithms() const {
        switch (config_.algorithm) {
            case AlgorithmSelection::BASELINE:  return {ALGORITHM_BASELINE};
            case AlgorithmSelection::OPTIMIZED: return {ALGORITHM_OPTIMIZED};
            case AlgorithmSelection::BOTH:      return {ALGORITHM_BASELINE, ALGORITHM_OPTIMIZED};
        }
        return {ALGORITHM_BASELINE};
    }

    inline RunRecord BenchmarkRunner::measure(std::span<const int32_t> values, const char* algorithm,
                                              const std::string& label) {
        WideSubarrayResult result;
        const bool optimized = std::string_view(algorithm) == ALGORITHM_OPTIMIZED;
        if (optimized) {
            // reject invalid input before the metrics are touched
            detail::requireInput(values);
            metrics_.reset();
            metrics_.startTimer();
            result = scanOptimized<int64_t>(values);
            metrics_.stopTimer();
        } else {
            result = scan<int64_t>(values, metrics_);
        }

        if (!isValidResult(values, result)) {
            metrics_.reset();
            std::ostringstream msg;
            msg << algorithm << " produced an invalid result " << result
                << " for " << values.size() << " " << label << " elements";
            throw ValidationError(msg.str());
        }

        return optimized ? optimized_.record(metrics_, values.size(), label)
                         : baseline_.record(metrics_, values.size(), label);
    }

    inline void BenchmarkRunner::runWarmup() {
        for (size_t size : DEFAULT_WARMUP_SIZES) {
            for (size_t i = 0; i < config_.warmupIterations; ++i) {
                const auto values = generator_.generate(size, Distribution::RANDOM);
                for (const char* algorithm : selectedAlgorithms()) {
                    measure(values, algorithm, std::string(toString(Distribution::RANDOM)));
                }
                if (config_.verbose) {
                    log_ << "  Warmup: size=" << size << ", iteration=" << (i + 1) << "\n";
                }
            }
        }
        history_.clear();
    }

    inline std::vector<ConfigurationResult> BenchmarkRunner::runSuite() {
        validateConfig(config_);

        const auto algorithms = selectedAlgorithms();
        const size_t total = config_.sizes.size() * config_.distributions.size() * config_.iterations;
        size_t current = 0;
        log_ << "Running " << total << " test combinations...\n";

        std::vector<ConfigurationResult> results;
        for (size_t size : config_.sizes) {
            for (Distribution dist : config_.distributions) {
                const std::string label(toString(dist));
                std::vector<std::vector<RunRecord>> runs(algorithms.size());

                for (size_t iter = 0; iter < config_.iterations; ++iter) {
                    ++current;
                    if (config_.verbose) {
                        log_ << "  Progress: " << current << "/" << total
                             << " (Size: " << size << ", Dist: " << label
                             << ", Iter: " << (iter + 1) << ")\n";
                    }
                    // every algorithm sees the same array
                    const auto values = generator_.generate(size, dist);
                    for (size_t a = 0; a < algorithms.size(); ++a) {
                        runs[a].push_back(measure(values, algorithms[a], label));
                    }
                }

                for (size_t a = 0; a < algorithms.size(); ++a) {
                    const AggregateStats stats = aggregateAll(runs[a]);
                    ConfigurationResult r;
                    r.algorithm          = algorithms[a];
                    r.size               = size;
                    r.distribution       = label;
                    r.iterations         = stats.count;
                    r.avgTimeMs          = stats.elapsedMillis.mean;
                    r.minTimeMs          = stats.elapsedMillis.min;
                    r.maxTimeMs          = stats.elapsedMillis.max;
                    r.stdDevMs           = stats.elapsedMillis.stddev;
                    r.avgComparisons     = stats.comparisons.mean;
                    r.avgElementAccesses = stats.elementAccesses.mean;
                    results.push_back(r);

                    const auto flags = log_.flags();
                    const auto precision = log_.precision();
                    log_ << "  Completed: size=" << std::setw(8) << size
                         << ", dist=" << std::left << std::setw(15) << label << std::right
                         << (algorithms.size() > 1 ? " [" + detail::algorithmTag(r.algorithm) + "]" : std::string())
                         << " -> avg: " << std::fixed << std::setprecision(3) << r.avgTimeMs << " ms\n";
                    log_.flags(flags);
                    log_.precision(precision);
                }
            }
        }
        return results;
    }

    inline std::vector<RunRecord> BenchmarkRunner::runBatch(const std::vector<std::vector<int32_t>>& arrays,
                                                            const std::vector<std::string>& labels) {
        if (arrays.size() != labels.size()) {
            throw ConfigurationError("Batch needs one label per array: " + std::to_string(arrays.size()) +
                                     " arrays, " + std::to_string(labels.size()) + " labels.");
        }

        std::vector<RunRecord> records;
        records.reserve(arrays.size() * selectedAlgorithms().size());
        for (size_t i = 0; i < arrays.size(); ++i) {
            for (const char* algorithm : selectedAlgorithms()) {
                records.push_back(measure(arrays[i], algorithm, labels[i]));
            }
        }
        return records;
    }

    inline std::vector<std::filesystem::path> BenchmarkRunner::exportResults(const std::vector<ConfigurationResult>& results) {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(config_.outputDir, ec);
        if (ec) {
            throw std::runtime_error("Error: Cannot create directory: " + config_.outputDir.string() +
                                     " (Error: " + ec.message() + ")");
        }

        const std::string stamp = std::to_string(wallClockMillis());
        std::vector<fs::path> written;

        for (const char* algorithm : selectedAlgorithms()) {
            const auto subset = detail::resultsFor(results, algorithm);
            const std::string tag = detail::algorithmTag(algorithm);

            const fs::path details = config_.outputDir / ("kadane_benchmark_details_" + tag + "_" + stamp + ".csv");
            CsvWriter detailsWriter(DETAILS_CSV_COLUMNS);
            detail::openFile(detailsWriter, details, true);
            detail::writeDetails(detailsWriter, subset);
            detailsWriter.close();
            written.push_back(details);

            const fs::path scaling = config_.outputDir / ("kadane_benchmark_scaling_" + tag + "_" + stamp + ".csv");
            CsvWriter scalingWriter(SCALING_CSV_COLUMNS);
            detail::openFile(scalingWriter, scaling, true);
            detail::writeScaling(scalingWriter, subset);
            scalingWriter.close();
            written.push_back(scaling);
        }

        if (!history_.empty()) {
            const fs::path runs = config_.outputDir / ("kadane_performance_metrics_" + stamp + ".csv");
            exportRunsCsv(history_, runs);
            written.push_back(runs);

            const fs::path summary = config_.outputDir / ("kadane_run_summary_" + stamp + ".csv");
            exportSummaryCsv(history_, summary);
            written.push_back(summary);

            const auto records = history_.snapshot();
            const LinearModel model = calibrateLinearModel(records);
            const fs::path complexity = config_.outputDir / ("kadane_complexity_" + stamp + ".csv");
            exportComplexityCsv(history_, complexity, model);
            written.push_back(complexity);
        }

        log_ << "\nExported results to:\n";
        for (const auto& path : written) {
            log_ << "  - " << path.string() << "\n";
        }
        return written;
    }

    inline std::vector<ConfigurationResult> BenchmarkRunner::run() {
        validateConfig(config_);
        log_ << "\nStarting benchmark...\n";

        if (config_.warmupIterations > 0) {
            log_ << "\nPhase 1: Warmup (" << config_.warmupIterations << " iterations)\n";
            runWarmup();
        }

        log_ << "\nPhase 2: Main Benchmark\n";
        auto results = runSuite();

        if (config_.exportCsv) {
            exportResults(results);
        }

        printSummary(results, log_);
        return results;
    }

    // ========================================================================
    // Reports
    // ========================================================================

    inline void BenchmarkRunner::printConfiguration(std::ostream& os) const {
        os << "Configuration:\n";
        os << "  Sizes:          ";
        for (size_t i = 0; i < config_.sizes.size(); ++i) {
            os << (i > 0 ? ", " : "") << config_.sizes[i];
        }
        os << "\n  Distributions:  ";
        for (size_t i = 0; i < config_.distributions.size(); ++i) {
            os << (i > 0 ? ", " : "") << toString(config_.distributions[i]);
        }
        os << "\n  Algorithm:      " << toString(config_.algorithm)
           << "\n  Warmup:         " << config_.warmupIterations
           << "\n  Iterations:     " << config_.iterations
           << "\n  Seed:           " << config_.seed
           << "\n  Export CSV:     " << (config_.exportCsv ? "yes" : "no");
        if (config_.exportCsv) {
            os << " (" << config_.outputDir.string() << ")";
        }
        os << "\n";
    }

    inline void BenchmarkRunner::printSummary(const std::vector<ConfigurationResult>& results, std::ostream& os) const {
        const std::string rule(80, '=');
        const std::string line(80, '-');
        const auto flags = os.flags();
        const auto precision = os.precision();

        for (const char* algorithm : selectedAlgorithms()) {
            auto subset = detail::resultsFor(results, algorithm);
            std::stable_sort(subset.begin(), subset.end(),
                             [](const auto& a, const auto& b) { return a.size < b.size; });

            os << "\n" << rule << "\nBENCHMARK SUMMARY (" << algorithm << ")\n" << rule << "\n";
            os << std::left
               << std::setw(12) << "Size"       << " " << std::setw(15) << "Distribution" << " "
               << std::setw(12) << "Avg Time"   << " " << std::setw(12) << "Min Time" << " "
               << std::setw(12) << "Max Time"   << " " << std::setw(12) << "Std Dev" << "\n"
               << std::setw(12) << "(elements)" << " " << std::setw(15) << "" << " "
               << std::setw(12) << "(ms)"       << " " << std::setw(12) << "(ms)" << " "
               << std::setw(12) << "(ms)"       << " " << std::setw(12) << "(ms)" << "\n"
               << line << "\n";

            os << std::fixed << std::setprecision(3);
            for (size_t i = 0; i < subset.size(); ++i) {
                const auto& r = subset[i];
                os << std::setw(12) << r.size << " " << std::setw(15) << r.distribution << " "
                   << std::setw(12) << r.avgTimeMs << " " << std::setw(12) << r.minTimeMs << " "
                   << std::setw(12) << r.maxTimeMs << " " << std::setw(12) << r.stdDevMs << "\n";
                if (i + 1 == subset.size() || subset[i + 1].size != r.size) {
                    os << line << "\n";
                }
            }
            os.flags(flags);
            os.precision(precision);
        }

        printComplexityAnalysis(results, os);
    }

    inline void BenchmarkRunner::printComplexityAnalysis(const std::vector<ConfigurationResult>& results,
                                                         std::ostream& os) const {
        const auto flags = os.flags();
        const auto precision = os.precision();

        for (const char* algorithm : selectedAlgorithms()) {
            const auto rows = scalingRows(detail::resultsFor(results, algorithm));

            os << "\nCOMPLEXITY ANALYSIS (" << algorithm << ")\n" << std::string(50, '-') << "\n";
            if (rows.size() < 2) {
                os << "Need at least 2 different sizes for complexity analysis\n";
                continue;
            }

            os << std::left << std::setw(12) << "Size" << " " << std::setw(12) << "Avg Time" << " "
               << std::setw(12) << "Time/Element" << " " << "O(n) Ratio" << "\n"
               << std::string(50, '-') << "\n";

            os << std::fixed << std::setprecision(3);
            for (size_t i = 0; i < rows.size(); ++i) {
                std::string ratio = "-";
                if (i > 0 && rows[i - 1].timePerElementNs > 0.0) {
                    // linear scaling keeps time per element constant (ratio near 1)
                    std::ostringstream r;
                    r << std::fixed << std::setprecision(2)
                      << rows[i].timePerElementNs / rows[i - 1].timePerElementNs
                      << " (exp: 1.00)";
                    ratio = r.str();
                }
                os << std::setw(12) << rows[i].size << " " << std::setw(12) << rows[i].avgTimeMs << " "
                   << std::setw(12) << rows[i].timePerElementNs << " " << ratio << "\n";
            }
            os.flags(flags);
            os.precision(precision);
        }
    }

} // namespace kadane
