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
 * @file run_history.hpp
 * @brief RunHistory and RunRecorder implementations.
 */

#include "run_history.h"
#include "metrics.hpp"
#include <utility>

namespace kadane {

    inline int64_t wallClockMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // ========================================================================
    // RunHistory
    // ========================================================================

    inline void RunHistory::append(RunRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
    }

    inline void RunHistory::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

    inline bool RunHistory::empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.empty();
    }

    inline size_t RunHistory::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    inline std::vector<RunRecord> RunHistory::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    // ========================================================================
    // RunRecorder
    // ========================================================================

    inline RunRecorder::RunRecorder(RunHistory& history, std::string algorithmLabel)
        : history_(history)
        , algorithm_(std::move(algorithmLabel))
    {
    }

    inline RunRecord RunRecorder::record(MetricsCounter& metrics, size_t inputSize, const std::string& inputType) {
        return record(metrics, algorithm_, inputSize, inputType);
    }

    inline RunRecord RunRecorder::record(MetricsCounter& metrics, const std::string& algorithmLabel,
                                         size_t inputSize, const std::string& inputType) {
        RunRecord rec;
        rec.algorithm       = algorithmLabel;
        rec.timestamp       = wallClockMillis();
        rec.inputSize       = inputSize;
        rec.inputType       = inputType;
        rec.comparisons     = metrics.comparisons();
        rec.elementAccesses = metrics.elementAccesses();
        rec.allocations     = metrics.allocations();
        rec.elapsed         = metrics.elapsed();

        history_.append(rec);
        metrics.reset();
        return rec;
    }

} // namespace kadane
