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
 * @file statistics.h
 * @brief Statistics aggregator: reduces RunRecords into per-group summaries.
 *
 * Every call recomputes from the records it is given; nothing is cached, so the
 * RunHistory stays the single source of truth. Groups without records produce
 * no entry. Standard deviation is the population form (divide by count).
 *
 *     auto records = history.snapshot();
 *     auto groups  = kadane::aggregate(records);                          // by (size, type)
 *     auto bySize  = kadane::aggregate(records, kadane::groupBySize);
 *     double avgMs = groups.at({1000, "random"}).elapsedMillis.mean;
 */

#include <compare>
#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "run_history.h"

namespace kadane {

    struct FieldStats {
        double  mean    = 0.0;
        double  min     = 0.0;
        double  max     = 0.0;
        double  stddev  = 0.0;  // population
    };

    struct AggregateStats {
        size_t      count = 0;
        FieldStats  comparisons;
        FieldStats  elementAccesses;
        FieldStats  allocations;
        FieldStats  elapsedNanos;
        FieldStats  elapsedMillis;
    };

    /// Default grouping key: (inputSize, inputType).
    struct GroupKey {
        size_t      inputSize = 0;
        std::string inputType;

        auto operator<=>(const GroupKey&) const = default;
    };

    GroupKey            groupBySizeAndType(const RunRecord& record);
    size_t              groupBySize(const RunRecord& record);
    std::string         groupByAlgorithm(const RunRecord& record);

    /// Mean, min, max and population standard deviation. Zeroes for no samples.
    FieldStats          summarize(std::span<const double> values);

    /// Summary over all records, ungrouped.
    AggregateStats      aggregateAll(std::span<const RunRecord> records);

    template<typename KeyFn>
    using GroupKeyOf = std::decay_t<std::invoke_result_t<KeyFn&, const RunRecord&>>;

    template<typename KeyFn>
    std::map<GroupKeyOf<KeyFn>, AggregateStats> aggregate(std::span<const RunRecord> records, KeyFn&& keyFn);

    std::map<GroupKey, AggregateStats> aggregate(std::span<const RunRecord> records);

} // namespace kadane
