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
 * @file csv_export.hpp
 * @brief CSV export implementations.
 */

#include "csv_export.h"
#include "csv_writer.hpp"
#include "run_history.hpp"
#include "statistics.hpp"
#include <stdexcept>

namespace kadane {

    namespace detail {

        inline std::vector<CsvValue> runRow(const RunRecord& r) {
            return {
                r.algorithm,
                static_cast<int64_t>(r.timestamp),
                static_cast<uint64_t>(r.inputSize),
                r.inputType,
                static_cast<uint64_t>(r.comparisons),
                static_cast<uint64_t>(r.elementAccesses),
                static_cast<uint64_t>(r.allocations),
                static_cast<int64_t>(r.elapsedNanos()),
                r.elapsedMillis()
            };
        }

        inline void openFile(CsvWriter& writer, const std::filesystem::path& path, bool overwrite) {
            if (!writer.open(path, overwrite)) {
                throw std::runtime_error(writer.getErrorMsg());
            }
        }

        inline void writeRuns(CsvWriter& writer, std::span<const RunRecord> records) {
            for (const auto& r : records) {
                writer.writeRow(runRow(r));
            }
        }

        inline void writeSummary(CsvWriter& writer, std::span<const RunRecord> records) {
            for (const auto& [key, stats] : aggregate(records)) {
                writer.writeRow({
                    static_cast<uint64_t>(key.inputSize),
                    key.inputType,
                    stats.comparisons.mean,
                    stats.elementAccesses.mean,
                    stats.allocations.mean,
                    stats.elapsedMillis.mean,
                    stats.elapsedMillis.min,
                    stats.elapsedMillis.max
                });
            }
        }

        inline void writeComplexity(CsvWriter& writer, std::span<const RunRecord> records, const LinearModel& model) {
            for (const auto& r : records) {
                // the optimized scan is not instrumented: no comparison counts to compare
                const bool counted = r.algorithm != ALGORITHM_OPTIMIZED;
                writer.writeRow({
                    r.algorithm,
                    static_cast<uint64_t>(r.inputSize),
                    r.inputType,
                    r.elapsedMillis(),
                    model.timeMillis(r.inputSize),
                    counted ? CsvValue{static_cast<uint64_t>(r.comparisons)} : CsvValue{std::string()},
                    counted ? CsvValue{model.comparisons(r.inputSize)} : CsvValue{std::string()}
                });
            }
        }

    } // namespace detail

    inline LinearModel calibrateLinearModel(std::span<const RunRecord> records) {
        auto meanNanosPerElement = [&](bool baselineOnly, double& mean) {
            double sum = 0.0;
            size_t n = 0;
            for (const auto& r : records) {
                if (r.inputSize == 0 || (baselineOnly && r.algorithm != ALGORITHM_BASELINE)) {
                    continue;
                }
                sum += static_cast<double>(r.elapsedNanos()) / static_cast<double>(r.inputSize);
                ++n;
            }
            if (n > 0) {
                mean = sum / static_cast<double>(n);
            }
            return n > 0;
        };

        LinearModel model;
        if (!meanNanosPerElement(true, model.nanosPerElement)) {
            meanNanosPerElement(false, model.nanosPerElement);
        }
        return model;
    }

    // ── Stream targets ──────────────────────────────────────────────────

    inline void writeRunsCsv(std::ostream& os, std::span<const RunRecord> records) {
        CsvWriter writer(RUN_CSV_COLUMNS);
        writer.open(os);
        detail::writeRuns(writer, records);
        writer.close();
    }

    inline void writeSummaryCsv(std::ostream& os, std::span<const RunRecord> records) {
        CsvWriter writer(SUMMARY_CSV_COLUMNS);
        writer.open(os);
        detail::writeSummary(writer, records);
        writer.close();
    }

    inline void writeComplexityCsv(std::ostream& os, std::span<const RunRecord> records, const LinearModel& model) {
        CsvWriter writer(COMPLEXITY_CSV_COLUMNS);
        writer.open(os);
        detail::writeComplexity(writer, records, model);
        writer.close();
    }

    // ── File targets ────────────────────────────────────────────────────

    inline void exportRunsCsv(const RunHistory& history, const std::filesystem::path& path, bool overwrite) {
        const auto records = history.snapshot();
        CsvWriter writer(RUN_CSV_COLUMNS);
        detail::openFile(writer, path, overwrite);
        detail::writeRuns(writer, records);
        writer.close();
    }

    inline void exportSummaryCsv(const RunHistory& history, const std::filesystem::path& path, bool overwrite) {
        const auto records = history.snapshot();
        CsvWriter writer(SUMMARY_CSV_COLUMNS);
        detail::openFile(writer, path, overwrite);
        detail::writeSummary(writer, records);
        writer.close();
    }

    inline void exportComplexityCsv(const RunHistory& history, const std::filesystem::path& path,
                                    const LinearModel& model, bool overwrite) {
        const auto records = history.snapshot();
        CsvWriter writer(COMPLEXITY_CSV_COLUMNS);
        detail::openFile(writer, path, overwrite);
        detail::writeComplexity(writer, records, model);
        writer.close();
    }

    inline void exportCombinedCsv(const std::vector<const RunHistory*>& histories,
                                  const std::filesystem::path& path, bool overwrite) {
        CsvWriter writer(RUN_CSV_COLUMNS);
        detail::openFile(writer, path, overwrite);
        for (const RunHistory* history : histories) {
            if (history == nullptr) {
                continue;
            }
            detail::writeRuns(writer, history->snapshot());
        }
        writer.close();
    }

} // namespace kadane
