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
 * @file array_generator.hpp
 * @brief ArrayGenerator implementations.
 */

#include "array_generator.h"

namespace kadane {

    inline ArrayGenerator::ArrayGenerator(uint32_t seed)
        : seed_(seed)
        , rng_(seed)
    {
    }

    inline void ArrayGenerator::reseed(uint32_t seed) {
        seed_ = seed;
        rng_.seed(seed);
    }

    inline int32_t ArrayGenerator::uniform(int32_t lo, int32_t hi) {
        std::uniform_int_distribution<int32_t> dist(lo, hi);
        return dist(rng_);
    }

    inline std::vector<int32_t> ArrayGenerator::generate(size_t size, Distribution dist) {
        std::vector<int32_t> values(size);

        switch (dist) {
            case Distribution::RANDOM:
                for (auto& v : values) v = uniform(-100, 100);
                break;
            case Distribution::SORTED:
                for (size_t i = 0; i < size; ++i) values[i] = static_cast<int32_t>(i + 1);
                break;
            case Distribution::REVERSE_SORTED:
                for (size_t i = 0; i < size; ++i) values[i] = static_cast<int32_t>(size - i);
                break;
            case Distribution::ALL_POSITIVE:
                for (auto& v : values) v = uniform(1, 100);
                break;
            case Distribution::ALL_NEGATIVE:
                for (auto& v : values) v = uniform(-100, -1);
                break;
            case Distribution::ALTERNATING:
                for (size_t i = 0; i < size; ++i) values[i] = (i % 2 == 0) ? 1 : -1;
                break;
            case Distribution::SPARSE_POSITIVE:
                for (auto& v : values) {
                    // draw order: selector first, then the value
                    const bool positive = uniform(0, 9) == 0;
                    v = positive ? uniform(1, 100) : uniform(-15, -6);
                }
                break;
        }
        return values;
    }

    inline std::vector<int32_t> ArrayGenerator::generate(size_t size, std::string_view distLabel) {
        return generate(size, distributionFromString(distLabel));
    }

} // namespace kadane
