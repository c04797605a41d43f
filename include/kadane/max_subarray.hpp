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
 * @file max_subarray.hpp
 * @brief Maximum-subarray engine template implementations.
 */

#include "max_subarray.h"
#include "metrics.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace kadane {

    namespace detail {

        inline void requireInput(Sequence sequence) {
            if (sequence.data() == nullptr) {
                throw InvalidInputError("Input sequence cannot be null");
            }
            if (sequence.empty()) {
                throw InvalidInputError("Input sequence cannot be empty");
            }
        }

    } // namespace detail

    // ── SubarrayResultT ─────────────────────────────────────────────────

    template<Accumulator Sum>
    std::optional<std::vector<Element>> SubarrayResultT<Sum>::subarray(Sequence original) const {
        if (original.empty() || endIndex >= original.size() || startIndex > endIndex) {
            return std::nullopt;
        }
        return std::vector<Element>(original.begin() + static_cast<std::ptrdiff_t>(startIndex),
                                    original.begin() + static_cast<std::ptrdiff_t>(endIndex) + 1);
    }

    template<Accumulator Sum>
    std::ostream& operator<<(std::ostream& os, const SubarrayResultT<Sum>& result) {
        os << "{maxSum=" << result.maxSum
           << ", start=" << result.startIndex
           << ", end=" << result.endIndex << "}";
        return os;
    }

    // ── Baseline scan ───────────────────────────────────────────────────

    template<Accumulator Sum, MetricsSink Metrics>
    SubarrayResultT<Sum> scan(Sequence sequence, Metrics& metrics) {
        detail::requireInput(sequence);

        metrics.reset();
        metrics.startTimer();

        const Sum first = static_cast<Sum>(sequence[0]);
        metrics.increment(Counter::ELEMENT_ACCESSES);

        Sum     running      = first;
        Sum     best         = first;
        size_t  runningStart = 0;
        size_t  bestStart    = 0;
        size_t  bestEnd      = 0;

        const size_t n = sequence.size();
        for (size_t i = 1; i < n; ++i) {
            const Sum value = static_cast<Sum>(sequence[i]);
            metrics.increment(Counter::ELEMENT_ACCESSES);

            // Extend or restart; extension wins ties
            const Sum extended = wrappingAdd(running, value);
            metrics.increment(Counter::COMPARISONS);
            if (value > extended) {
                running = value;
                runningStart = i;
            } else {
                running = extended;
            }

            // Strictly greater: the earliest range with the maximum sum is kept
            metrics.increment(Counter::COMPARISONS);
            if (running > best) {
                best = running;
                bestStart = runningStart;
                bestEnd = i;
            }
        }

        metrics.stopTimer();
        return SubarrayResultT<Sum>{best, bestStart, bestEnd};
    }

    template<Accumulator Sum>
    SubarrayResultT<Sum> scan(Sequence sequence) {
        NullMetrics none;
        return scan<Sum>(sequence, none);
    }

    // ── Optimized scan ──────────────────────────────────────────────────

    /*
     * Phase 1 walks the leading run of negative elements and remembers the first
     * occurrence of the largest one. The baseline restarts at every step of that
     * run unless running + value wraps past the minimum of Sum, in which case it
     * extends into the wrapped sum; such inputs fall back to the baseline loop.
     * If the whole input is negative the largest element is the answer.
     *
     * Otherwise the baseline restarts at the first non-negative element j and
     * promotes it over the negative best, so phase 2 runs the baseline step
     * from j with the same restart predicate.
     */
    template<Accumulator Sum>
    SubarrayResultT<Sum> scanOptimized(Sequence sequence) {
        detail::requireInput(sequence);

        const Element* data = sequence.data();
        const size_t n = sequence.size();

        size_t  j = 0;
        Element maxNegative = data[0];
        size_t  maxIndex = 0;
        while (j < n && data[j] < 0) {
            if (j > 0) {
                const Sum previous = static_cast<Sum>(data[j - 1]);
                const Sum value = static_cast<Sum>(data[j]);
                if (!(value > wrappingAdd(previous, value))) {
                    return scan<Sum>(sequence);
                }
            }
            if (data[j] > maxNegative) {
                maxNegative = data[j];
                maxIndex = j;
            }
            ++j;
        }
        if (j == n) {
            return SubarrayResultT<Sum>{static_cast<Sum>(maxNegative), maxIndex, maxIndex};
        }

        Sum     running      = static_cast<Sum>(data[j]);
        Sum     best         = running;
        size_t  runningStart = j;
        size_t  bestStart    = j;
        size_t  bestEnd      = j;

        for (size_t i = j + 1; i < n; ++i) {
            const Sum value = static_cast<Sum>(data[i]);
            const Sum extended = wrappingAdd(running, value);
            if (value > extended) {
                running = value;
                runningStart = i;
            } else {
                running = extended;
            }
            if (running > best) {
                best = running;
                bestStart = runningStart;
                bestEnd = i;
            }
        }
        return SubarrayResultT<Sum>{best, bestStart, bestEnd};
    }

    // ── References ──────────────────────────────────────────────────────

    template<Accumulator Sum>
    SubarrayResultT<Sum> bruteForce(Sequence sequence) {
        detail::requireInput(sequence);

        SubarrayResultT<Sum> best{static_cast<Sum>(sequence[0]), 0, 0};
        for (size_t start = 0; start < sequence.size(); ++start) {
            Sum sum = 0;
            for (size_t end = start; end < sequence.size(); ++end) {
                sum = wrappingAdd(sum, static_cast<Sum>(sequence[end]));
                if (sum > best.maxSum) {
                    best = SubarrayResultT<Sum>{sum, start, end};
                }
            }
        }
        return best;
    }

    template<Accumulator Sum>
    Sum rangeSum(Sequence sequence, size_t start, size_t end) {
        if (start > end || end >= sequence.size()) {
            throw std::out_of_range("Invalid range [" + std::to_string(start) + ", " +
                                    std::to_string(end) + "] for sequence of length " +
                                    std::to_string(sequence.size()));
        }
        Sum sum = 0;
        for (size_t i = start; i <= end; ++i) {
            sum = wrappingAdd(sum, static_cast<Sum>(sequence[i]));
        }
        return sum;
    }

    template<Accumulator Sum>
    bool isValidResult(Sequence sequence, const SubarrayResultT<Sum>& result) {
        if (sequence.empty()
            || result.startIndex > result.endIndex
            || result.endIndex >= sequence.size()) {
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "Result " << result << " out of range for length "
                          << sequence.size() << std::endl;
            }
            return false;
        }
        return rangeSum<Sum>(sequence, result.startIndex, result.endIndex) == result.maxSum;
    }

} // namespace kadane
