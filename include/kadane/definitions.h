/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the KADANE library */
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace kadane {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Library-internal diagnostics on std::cerr
    constexpr bool DEBUG_OUTPUTS = false;

    // Benchmark defaults
    constexpr uint32_t DEFAULT_SEED              = 42;
    constexpr size_t   DEFAULT_WARMUP_ITERATIONS = 3;
    constexpr size_t   DEFAULT_ITERATIONS        = 5;
    constexpr std::array<size_t, 4> DEFAULT_SIZES        = {100, 1000, 10000, 100000};
    constexpr std::array<size_t, 3> DEFAULT_WARMUP_SIZES = {1000, 5000, 10000};

    // Algorithm labels recorded with every run
    inline constexpr const char* ALGORITHM_BASELINE  = "KadaneAlgorithm";
    inline constexpr const char* ALGORITHM_OPTIMIZED = "KadaneAlgorithmOptimized";

    // ── Errors ──────────────────────────────────────────────────────────

    /// Sequence absent or empty. Raised before any metrics side effect.
    class InvalidInputError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// Malformed benchmark configuration (sizes, labels, counts).
    class ConfigurationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// A scan result that violates the index/sum invariant.
    class ValidationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // ── Operation counters ─────────────────────────────────────────────

    enum class Counter : uint8_t {
        COMPARISONS      = 0,
        ELEMENT_ACCESSES = 1,
        ALLOCATIONS      = 2
    };

    constexpr size_t COUNTER_COUNT = 3;

    constexpr std::string_view toString(Counter counter) {
        switch (counter) {
            case Counter::COMPARISONS:      return "comparisons";
            case Counter::ELEMENT_ACCESSES: return "elementAccesses";
            case Counter::ALLOCATIONS:      return "allocations";
        }
        return "unknown";
    }

    // ── Input distributions ─────────────────────────────────────────────

    enum class Distribution : uint8_t {
        RANDOM          = 0,
        SORTED          = 1,
        REVERSE_SORTED  = 2,
        ALL_POSITIVE    = 3,
        ALL_NEGATIVE    = 4,
        ALTERNATING     = 5,
        SPARSE_POSITIVE = 6
    };

    constexpr std::array<Distribution, 7> ALL_DISTRIBUTIONS = {
        Distribution::RANDOM,       Distribution::SORTED,      Distribution::REVERSE_SORTED,
        Distribution::ALL_POSITIVE, Distribution::ALL_NEGATIVE, Distribution::ALTERNATING,
        Distribution::SPARSE_POSITIVE
    };

    // sparse_positive is opt-in
    constexpr std::array<Distribution, 6> DEFAULT_DISTRIBUTIONS = {
        Distribution::RANDOM,       Distribution::SORTED,      Distribution::REVERSE_SORTED,
        Distribution::ALL_POSITIVE, Distribution::ALL_NEGATIVE, Distribution::ALTERNATING
    };

    constexpr std::string_view toString(Distribution dist) {
        switch (dist) {
            case Distribution::RANDOM:          return "random";
            case Distribution::SORTED:          return "sorted";
            case Distribution::REVERSE_SORTED:  return "reverse_sorted";
            case Distribution::ALL_POSITIVE:    return "all_positive";
            case Distribution::ALL_NEGATIVE:    return "all_negative";
            case Distribution::ALTERNATING:     return "alternating";
            case Distribution::SPARSE_POSITIVE: return "sparse_positive";
        }
        return "unknown";
    }

    /// Parse a distribution label. Throws ConfigurationError on unknown labels.
    inline Distribution distributionFromString(std::string_view label) {
        for (Distribution d : ALL_DISTRIBUTIONS) {
            if (toString(d) == label) {
                return d;
            }
        }
        throw ConfigurationError("Unknown distribution '" + std::string(label) +
                                 "'. Expected: random, sorted, reverse_sorted, all_positive, "
                                 "all_negative, alternating, sparse_positive.");
    }

    // ── Fixed-width arithmetic ──────────────────────────────────────────

    /**
     * @brief Two's complement addition that wraps on overflow.
     *
     * Signed overflow is undefined in C++, so the addition is carried out in the
     * unsigned counterpart and converted back (modular since C++20).
     */
    template<typename T>
    constexpr T wrappingAdd(T a, T b) noexcept {
        static_assert(std::is_integral_v<T>, "wrappingAdd requires an integral type");
        using U = std::make_unsigned_t<T>;
        return static_cast<T>(static_cast<U>(a) + static_cast<U>(b));
    }

} // namespace kadane
