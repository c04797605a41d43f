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
 * @file run_history.h
 * @brief RunRecord snapshots, the append-only RunHistory and the RunRecorder.
 *
 * RunHistory is an explicit object owned by whoever drives the benchmark and is
 * handed to recorders, aggregators and exporters by reference. Appends and
 * clears are serialized; readers work on snapshot() copies.
 *
 *     kadane::RunHistory history;
 *     kadane::RunRecorder recorder(history, kadane::ALGORITHM_BASELINE);
 *     kadane::MetricsCounter metrics;
 *
 *     kadane::scan(values, metrics);
 *     recorder.record(metrics, values.size(), "random");   // resets metrics
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "definitions.h"
#include "metrics.h"

namespace kadane {

    /**
     * @brief Immutable snapshot of one engine invocation.
     */
    struct RunRecord {
        std::string                 algorithm;
        int64_t                     timestamp       = 0;    // wall clock, ms since epoch
        size_t                      inputSize       = 0;
        std::string                 inputType;
        uint64_t                    comparisons     = 0;
        uint64_t                    elementAccesses = 0;
        uint64_t                    allocations     = 0;
        std::chrono::nanoseconds    elapsed{0};

        int64_t elapsedNanos() const noexcept   { return elapsed.count(); }
        double  elapsedMillis() const noexcept  { return static_cast<double>(elapsed.count()) / 1e6; }
    };

    /**
     * @brief Ordered, append-only history of RunRecords.
     */
    class RunHistory {
        mutable std::mutex          mutex_;
        std::vector<RunRecord>      records_;

    public:
        RunHistory() = default;
        RunHistory(const RunHistory&) = delete;
        RunHistory& operator=(const RunHistory&) = delete;

        void                        append(RunRecord record);
        void                        clear();
        bool                        empty() const;
        size_t                      size() const;
        std::vector<RunRecord>      snapshot() const;
    };

    /**
     * @brief Freezes a MetricsCounter into a RunRecord and appends it to a history.
     */
    class RunRecorder {
        RunHistory&                 history_;
        std::string                 algorithm_;

    public:
        RunRecorder(RunHistory& history, std::string algorithmLabel);

        const std::string&          algorithm() const   { return algorithm_; }
        RunHistory&                 history()           { return history_; }
        const RunHistory&           history() const     { return history_; }

        RunRecord                   record(MetricsCounter& metrics, size_t inputSize, const std::string& inputType);
        RunRecord                   record(MetricsCounter& metrics, const std::string& algorithmLabel,
                                           size_t inputSize, const std::string& inputType);
    };

    /// Wall clock in milliseconds since the Unix epoch.
    int64_t                         wallClockMillis();

} // namespace kadane
