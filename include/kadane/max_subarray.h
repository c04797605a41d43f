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
 * @file max_subarray.h
 * @brief Maximum-subarray engine (Kadane's method with position tracking).
 *
 * scan() is the instrumented baseline, scanOptimized() a branch-reduced variant
 * with an all-negative fast path. Both return the same SubarrayResult on every
 * input, including inputs whose running sums wrap.
 *
 * Tie-breaking:
 *   - extension wins ties: restart at i only if sequence[i] > running + sequence[i]
 *   - first seen wins: the best range is replaced only by a strictly larger sum
 *
 * Overflow:
 *   Sums accumulate in the Sum type and wrap on overflow (two's complement).
 *   The default Sum is int32_t, the element width. Callers that need the true
 *   maximum for large inputs use Sum = int64_t (WideSubarrayResult).
 *
 * Usage:
 *     std::vector<int32_t> values = {-2, 1, -3, 4, -1, 2, 1, -5, 4};
 *     auto r = kadane::scan(values);                // {6, 3, 6}
 *     auto slice = r.subarray(values);              // {4, -1, 2, 1}
 *
 *     kadane::MetricsCounter metrics;
 *     auto w = kadane::scan<int64_t>(values, metrics);
 */

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <vector>

#include "definitions.h"
#include "metrics.h"

namespace kadane {

    using Element  = int32_t;
    using Sequence = std::span<const Element>;

    /// Accumulators must hold every element value.
    template<typename T>
    concept Accumulator = std::signed_integral<T> && (sizeof(T) >= sizeof(Element));

    /**
     * @brief Result of one scan: the maximum sum and its inclusive index range.
     *
     * Invariant: 0 <= startIndex <= endIndex < sequence length.
     */
    template<Accumulator Sum>
    struct SubarrayResultT {
        Sum     maxSum      = 0;
        size_t  startIndex  = 0;
        size_t  endIndex    = 0;

        size_t  length() const noexcept { return endIndex - startIndex + 1; }

        /// Copy of original[startIndex..endIndex]. std::nullopt when no original
        /// sequence is supplied or it is too short to hold the range.
        std::optional<std::vector<Element>> subarray(Sequence original) const;

        bool operator==(const SubarrayResultT&) const = default;
    };

    using SubarrayResult     = SubarrayResultT<int32_t>;
    using WideSubarrayResult = SubarrayResultT<int64_t>;

    template<Accumulator Sum>
    std::ostream& operator<<(std::ostream& os, const SubarrayResultT<Sum>& result);

    // ── Engine ──────────────────────────────────────────────────────────

    template<Accumulator Sum = int32_t, MetricsSink Metrics>
    SubarrayResultT<Sum>    scan(Sequence sequence, Metrics& metrics);

    template<Accumulator Sum = int32_t>
    SubarrayResultT<Sum>    scan(Sequence sequence);

    template<Accumulator Sum = int32_t>
    SubarrayResultT<Sum>    scanOptimized(Sequence sequence);

    // ── References and checks ───────────────────────────────────────────

    /// O(n^2) reference. Agrees with scan() on maxSum; ranges may differ on ties.
    template<Accumulator Sum = int32_t>
    SubarrayResultT<Sum>    bruteForce(Sequence sequence);

    /// Wrapping sum of sequence[start..end] (inclusive). Throws std::out_of_range.
    template<Accumulator Sum = int32_t>
    Sum                     rangeSum(Sequence sequence, size_t start, size_t end);

    /// Index invariant holds and the range sums to maxSum.
    template<Accumulator Sum>
    bool                    isValidResult(Sequence sequence, const SubarrayResultT<Sum>& result);

} // namespace kadane
