/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file array_generator_test.cpp
 * @brief Tests for the seeded distribution generators
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include <kadane/kadane.h>

using kadane::ArrayGenerator;
using kadane::Distribution;

class ArrayGeneratorTest : public ::testing::TestWithParam<Distribution> {};

TEST_P(ArrayGeneratorTest, ProducesRequestedSize) {
    ArrayGenerator gen;
    for (size_t n : {0u, 1u, 2u, 1000u}) {
        EXPECT_EQ(gen.generate(n, GetParam()).size(), n);
    }
}

TEST_P(ArrayGeneratorTest, SameSeedSameSequence) {
    ArrayGenerator a(7);
    ArrayGenerator b(7);
    EXPECT_EQ(a.generate(500, GetParam()), b.generate(500, GetParam()));
    EXPECT_EQ(a.generate(500, GetParam()), b.generate(500, GetParam()));
}

TEST_P(ArrayGeneratorTest, ReseedRestartsStream) {
    ArrayGenerator gen(11);
    const auto first = gen.generate(300, GetParam());
    gen.reseed(11);
    EXPECT_EQ(gen.generate(300, GetParam()), first);
    EXPECT_EQ(gen.seed(), 11u);
}

TEST_P(ArrayGeneratorTest, LabelOverloadMatchesEnum) {
    ArrayGenerator a;
    ArrayGenerator b;
    EXPECT_EQ(a.generate(100, kadane::toString(GetParam())), b.generate(100, GetParam()));
}

INSTANTIATE_TEST_SUITE_P(
    AllDistributions, ArrayGeneratorTest,
    ::testing::ValuesIn(kadane::ALL_DISTRIBUTIONS),
    [](const ::testing::TestParamInfo<Distribution>& info) {
        return std::string(kadane::toString(info.param));
    });

TEST(ArrayGeneratorValuesTest, DeterministicShapes) {
    ArrayGenerator gen;
    EXPECT_EQ(gen.generate(5, Distribution::SORTED), (std::vector<int32_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(gen.generate(5, Distribution::REVERSE_SORTED), (std::vector<int32_t>{5, 4, 3, 2, 1}));
    EXPECT_EQ(gen.generate(5, Distribution::ALTERNATING), (std::vector<int32_t>{1, -1, 1, -1, 1}));
}

TEST(ArrayGeneratorValuesTest, RandomRanges) {
    ArrayGenerator gen;
    auto inRange = [](const std::vector<int32_t>& v, int32_t lo, int32_t hi) {
        return std::all_of(v.begin(), v.end(), [&](int32_t x) { return x >= lo && x <= hi; });
    };

    EXPECT_TRUE(inRange(gen.generate(10000, Distribution::RANDOM), -100, 100));
    EXPECT_TRUE(inRange(gen.generate(10000, Distribution::ALL_POSITIVE), 1, 100));
    EXPECT_TRUE(inRange(gen.generate(10000, Distribution::ALL_NEGATIVE), -100, -1));
}

TEST(ArrayGeneratorValuesTest, SparsePositiveMix) {
    ArrayGenerator gen;
    const auto values = gen.generate(10000, Distribution::SPARSE_POSITIVE);

    size_t positives = 0;
    for (int32_t v : values) {
        if (v > 0) {
            ++positives;
            EXPECT_LE(v, 100);
        } else {
            EXPECT_GE(v, -15);
            EXPECT_LE(v, -6);
        }
    }
    // about 10% positive
    EXPECT_GT(positives, 700u);
    EXPECT_LT(positives, 1300u);
}

TEST(ArrayGeneratorValuesTest, UnknownLabelThrows) {
    ArrayGenerator gen;
    EXPECT_THROW(gen.generate(10, "gaussian"), kadane::ConfigurationError);
}

TEST(ArrayGeneratorValuesTest, DistributionLabelsRoundTrip) {
    for (auto d : kadane::ALL_DISTRIBUTIONS) {
        EXPECT_EQ(kadane::distributionFromString(kadane::toString(d)), d);
    }
    EXPECT_EQ(kadane::DEFAULT_DISTRIBUTIONS.size(), 6u);
    EXPECT_EQ(std::count(kadane::DEFAULT_DISTRIBUTIONS.begin(), kadane::DEFAULT_DISTRIBUTIONS.end(),
                         Distribution::SPARSE_POSITIVE), 0);
}
