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
 * @file metrics.h
 * @brief MetricsSink concept, the no-op NullMetrics port and the MetricsCounter.
 *
 * The scan engine is templated on a MetricsSink. Passing no sink selects
 * NullMetrics, whose members compile to nothing, so the uninstrumented scan
 * carries no counting overhead and the instrumented one cannot change results.
 *
 *     kadane::MetricsCounter metrics;
 *     auto result = kadane::scan(values, metrics);
 *     std::cout << metrics.comparisons() << " comparisons in "
 *               << metrics.elapsed().count() << " ns\n";
 *
 * A MetricsCounter belongs to one in-flight scan at a time (not thread-safe).
 */

#include <array>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <string>

#include "definitions.h"

namespace kadane {

    template<typename M>
    concept MetricsSink = requires(M sink, Counter kind, uint64_t n) {
        { sink.reset()              };
        { sink.increment(kind, n)   };
        { sink.startTimer()         };
        { sink.stopTimer()          };
    };

    /// Instrumentation port that records nothing.
    struct NullMetrics {
        constexpr void reset() noexcept {}
        constexpr void increment(Counter, uint64_t = 1) noexcept {}
        constexpr void startTimer() noexcept {}
        constexpr void stopTimer() noexcept {}
    };

    /**
     * @brief Operation counters plus a monotonic timer, scoped to one run.
     */
    class MetricsCounter {
    public:
        using Clock     = std::chrono::steady_clock;
        using Duration  = std::chrono::nanoseconds;

    private:
        std::array<uint64_t, COUNTER_COUNT> counts_{};  // indexed by Counter
        Clock::time_point   start_{};
        Clock::time_point   end_{};
        bool                started_ = false;
        bool                stopped_ = false;

    public:
        MetricsCounter() = default;

        void                reset() noexcept;
        void                increment(Counter kind, uint64_t n = 1) noexcept;
        void                startTimer() noexcept;
        void                stopTimer() noexcept;

        uint64_t            count(Counter kind) const noexcept  { return counts_[static_cast<size_t>(kind)]; }
        uint64_t            comparisons() const noexcept        { return count(Counter::COMPARISONS); }
        uint64_t            elementAccesses() const noexcept    { return count(Counter::ELEMENT_ACCESSES); }
        uint64_t            allocations() const noexcept        { return count(Counter::ALLOCATIONS); }
        Duration            elapsed() const noexcept;
        std::string         toString(const std::string& label = "") const;
    };

    static_assert(MetricsSink<NullMetrics>);
    static_assert(MetricsSink<MetricsCounter>);

} // namespace kadane
