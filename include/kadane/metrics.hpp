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
 * @file metrics.hpp
 * @brief MetricsCounter implementations.
 */

#include "metrics.h"
#include <sstream>

namespace kadane {

    inline void MetricsCounter::reset() noexcept {
        counts_.fill(0);
        start_   = Clock::time_point{};
        end_     = Clock::time_point{};
        started_ = false;
        stopped_ = false;
    }

    inline void MetricsCounter::increment(Counter kind, uint64_t n) noexcept {
        counts_[static_cast<size_t>(kind)] += n;
    }

    inline void MetricsCounter::startTimer() noexcept {
        start_   = Clock::now();
        started_ = true;
        stopped_ = false;
    }

    inline void MetricsCounter::stopTimer() noexcept {
        end_     = Clock::now();
        stopped_ = true;
    }

    // Zero unless a start/stop pair brackets the measurement
    inline MetricsCounter::Duration MetricsCounter::elapsed() const noexcept {
        if (!started_ || !stopped_ || end_ < start_) {
            return Duration::zero();
        }
        return std::chrono::duration_cast<Duration>(end_ - start_);
    }

    inline std::string MetricsCounter::toString(const std::string& label) const {
        std::ostringstream ss;
        if (!label.empty()) {
            ss << label << " ";
        }
        ss << "Metrics - Comparisons: " << comparisons()
           << ", Element Accesses: " << elementAccesses()
           << ", Allocations: " << allocations()
           << ", Time: " << elapsed().count() << " ns";
        return ss.str();
    }

} // namespace kadane
