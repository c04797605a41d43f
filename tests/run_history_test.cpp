/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file run_history_test.cpp
 * @brief Tests for RunHistory and RunRecorder
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

#include <kadane/kadane.h>

using namespace kadane;

TEST(RunHistoryTest, RecordFreezesMetricsAndResetsCounter) {
    RunHistory history;
    RunRecorder recorder(history, ALGORITHM_BASELINE);
    MetricsCounter metrics;

    std::vector<int32_t> values = {-2, 1, -3, 4, -1, 2, 1, -5, 4};
    scan(values, metrics);
    const auto elapsed = metrics.elapsed();

    const int64_t before = wallClockMillis();
    const RunRecord rec = recorder.record(metrics, values.size(), "random");
    const int64_t after = wallClockMillis();

    EXPECT_EQ(rec.algorithm, "KadaneAlgorithm");
    EXPECT_EQ(rec.inputSize, 9u);
    EXPECT_EQ(rec.inputType, "random");
    EXPECT_EQ(rec.comparisons, 16u);
    EXPECT_EQ(rec.elementAccesses, 9u);
    EXPECT_EQ(rec.allocations, 0u);
    EXPECT_EQ(rec.elapsed, elapsed);
    EXPECT_GE(rec.timestamp, before);
    EXPECT_LE(rec.timestamp, after);

    // counter is ready for the next run
    EXPECT_EQ(metrics.comparisons(), 0u);
    EXPECT_EQ(metrics.elementAccesses(), 0u);
    EXPECT_EQ(metrics.elapsed(), MetricsCounter::Duration::zero());

    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history.snapshot().front().comparisons, 16u);
}

TEST(RunHistoryTest, RecordWithExplicitLabel) {
    RunHistory history;
    RunRecorder recorder(history, ALGORITHM_BASELINE);
    MetricsCounter metrics;

    const RunRecord rec = recorder.record(metrics, ALGORITHM_OPTIMIZED, 100, "sorted");
    EXPECT_EQ(rec.algorithm, "KadaneAlgorithmOptimized");
    EXPECT_EQ(recorder.algorithm(), "KadaneAlgorithm");
    EXPECT_EQ(history.snapshot().front().algorithm, "KadaneAlgorithmOptimized");
}

TEST(RunHistoryTest, InsertionOrderIsPreserved) {
    RunHistory history;
    RunRecorder recorder(history, ALGORITHM_BASELINE);
    MetricsCounter metrics;

    for (size_t n = 1; n <= 5; ++n) {
        recorder.record(metrics, n * 10, "random");
    }
    const auto records = history.snapshot();
    ASSERT_EQ(records.size(), 5u);
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].inputSize, (i + 1) * 10);
    }
}

TEST(RunHistoryTest, ClearDiscardsRecords) {
    RunHistory history;
    RunRecorder recorder(history, ALGORITHM_BASELINE);
    MetricsCounter metrics;

    recorder.record(metrics, 1, "random");
    recorder.record(metrics, 2, "random");
    EXPECT_FALSE(history.empty());

    history.clear();
    EXPECT_TRUE(history.empty());
    EXPECT_EQ(history.size(), 0u);
    EXPECT_TRUE(history.snapshot().empty());
}

TEST(RunHistoryTest, SnapshotIsIndependentCopy) {
    RunHistory history;
    RunRecorder recorder(history, ALGORITHM_BASELINE);
    MetricsCounter metrics;

    recorder.record(metrics, 1, "random");
    auto snap = history.snapshot();
    recorder.record(metrics, 2, "random");
    snap.clear();

    EXPECT_EQ(history.size(), 2u);
}

TEST(RunHistoryTest, RecordersShareOneHistory) {
    RunHistory history;
    RunRecorder baseline(history, ALGORITHM_BASELINE);
    RunRecorder optimized(history, ALGORITHM_OPTIMIZED);
    MetricsCounter metrics;

    baseline.record(metrics, 10, "random");
    optimized.record(metrics, 10, "random");

    const auto records = history.snapshot();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].algorithm, ALGORITHM_BASELINE);
    EXPECT_EQ(records[1].algorithm, ALGORITHM_OPTIMIZED);
    EXPECT_EQ(&baseline.history(), &optimized.history());
}

TEST(RunHistoryTest, InvalidInputAppendsNothing) {
    RunHistory history;
    RunRecorder recorder(history, ALGORITHM_BASELINE);
    MetricsCounter metrics;

    std::vector<int32_t> empty;
    EXPECT_THROW({
        scan(empty, metrics);
        recorder.record(metrics, empty.size(), "random");
    }, InvalidInputError);
    EXPECT_TRUE(history.empty());
}

TEST(RunHistoryTest, ConcurrentAppendsAreSerialized) {
    RunHistory history;
    constexpr size_t kThreads = 4;
    constexpr size_t kPerThread = 250;

    std::vector<std::thread> threads;
    for (size_t t = 0; t < kThreads; ++t) {
        threads.emplace_back([&history, t] {
            RunRecorder recorder(history, ALGORITHM_BASELINE);
            MetricsCounter metrics;
            for (size_t i = 0; i < kPerThread; ++i) {
                recorder.record(metrics, t, "random");
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(history.size(), kThreads * kPerThread);
}

TEST(RunHistoryTest, ElapsedAccessors) {
    RunRecord rec;
    rec.elapsed = std::chrono::nanoseconds(2'500'000);
    EXPECT_EQ(rec.elapsedNanos(), 2'500'000);
    EXPECT_DOUBLE_EQ(rec.elapsedMillis(), 2.5);
}
