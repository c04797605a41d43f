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
 * @file array_generator.h
 * @brief Seeded synthetic input sequences for the benchmark distributions.
 *
 *   random            uniform [-100, 100]
 *   sorted            1, 2, ..., n
 *   reverse_sorted    n, n-1, ..., 1
 *   all_positive      uniform [1, 100]
 *   all_negative      uniform [-100, -1]
 *   alternating       1, -1, 1, -1, ...
 *   sparse_positive   10% uniform [1, 100], otherwise uniform [-15, -6]
 *
 * One generator instance yields a reproducible stream of arrays for a fixed
 * seed; consecutive calls continue the same random stream.
 */

#include <cstddef>
#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

#include "definitions.h"

namespace kadane {

    class ArrayGenerator {
        uint32_t        seed_;
        std::mt19937    rng_;

    public:
        explicit ArrayGenerator(uint32_t seed = DEFAULT_SEED);

        std::vector<int32_t>    generate(size_t size, Distribution dist);
        std::vector<int32_t>    generate(size_t size, std::string_view distLabel);
        void                    reseed(uint32_t seed);
        uint32_t                seed() const    { return seed_; }

    private:
        int32_t                 uniform(int32_t lo, int32_t hi);
    };

} // namespace kadane
