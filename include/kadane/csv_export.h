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
 * @file csv_export.h
 * @brief CSV exports of RunHistory contents.
 *
 *   runs        one row per RunRecord, insertion order
 *   summary     one row per (inputSize, inputType) group
 *   complexity  measured vs. linear-model time and comparison counts per run;
 *               comparison cells stay empty for the uninstrumented optimized scan
 *   combined    the runs export over several histories, in order
 *
 * write*() functions target a std::ostream; export*() functions create a file
 * and throw std::runtime_error (with the writer's message) when it cannot be
 * opened. A failed export never modifies the history.
 */

#include <filesystem>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "csv_writer.h"
#include "run_history.h"

namespace kadane {

    inline const std::vector<std::string> RUN_CSV_COLUMNS = {
        "algorithm", "timestamp", "inputSize", "inputType", "comparisons",
        "elementAccesses", "allocations", "elapsedNanos", "elapsedMillis"
    };

    inline const std::vector<std::string> SUMMARY_CSV_COLUMNS = {
        "inputSize", "inputType", "avgComparisons", "avgAccesses", "avgAllocations",
        "avgTimeMillis", "minTimeMillis", "maxTimeMillis"
    };

    inline const std::vector<std::string> COMPLEXITY_CSV_COLUMNS = {
        "algorithm", "inputSize", "inputType", "actualTimeMillis", "theoreticalTimeMillis",
        "actualComparisons", "theoreticalComparisons"
    };

    /// Linear cost model used by the complexity export.
    struct LinearModel {
        double nanosPerElement = 1.0;

        double      timeMillis(size_t n) const      { return static_cast<double>(n) * nanosPerElement / 1e6; }
        uint64_t    comparisons(size_t n) const     { return n > 0 ? 2 * static_cast<uint64_t>(n - 1) : 0; }
    };

    /// Mean measured ns/element over the baseline records, or over all records
    /// when no baseline ran. Keeps the default model for an empty span.
    LinearModel calibrateLinearModel(std::span<const RunRecord> records);

    void    writeRunsCsv(std::ostream& os, std::span<const RunRecord> records);
    void    writeSummaryCsv(std::ostream& os, std::span<const RunRecord> records);
    void    writeComplexityCsv(std::ostream& os, std::span<const RunRecord> records,
                               const LinearModel& model = {});

    void    exportRunsCsv(const RunHistory& history, const std::filesystem::path& path, bool overwrite = true);
    void    exportSummaryCsv(const RunHistory& history, const std::filesystem::path& path, bool overwrite = true);
    void    exportComplexityCsv(const RunHistory& history, const std::filesystem::path& path,
                                const LinearModel& model = {}, bool overwrite = true);
    void    exportCombinedCsv(const std::vector<const RunHistory*>& histories,
                              const std::filesystem::path& path, bool overwrite = true);

} // namespace kadane
