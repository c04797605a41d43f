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
 * @file statistics.hpp
 * @brief Statistics aggregator implementations.
 */

#include "statistics.h"
#include "run_history.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

namespace kadane {

    inline GroupKey groupBySizeAndType(const RunRecord& record) {
        return GroupKey{record.inputSize, record.inputType};
    }

    inline size_t groupBySize(const RunRecord& record) {
        return record.inputSize;
    }

    inline std::string groupByAlgorithm(const RunRecord& record) {
        return record.algorithm;
    }

    inline FieldStats summarize(std::span<const double> values) {
        FieldStats stats;
        if (values.empty()) {
            return stats;
        }

        const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
        stats.min = *lo;
        stats.max = *hi;

        double sum = 0.0;
        for (double v : values) {
            sum += v;
        }
        const double n = static_cast<double>(values.size());
        stats.mean = sum / n;

        double squared = 0.0;
        for (double v : values) {
            const double diff = v - stats.mean;
            squared += diff * diff;
        }
        stats.stddev = std::sqrt(squared / n);
        return stats;
    }

    namespace detail {

        inline AggregateStats reduceGroup(const std::vector<const RunRecord*>& group) {
            const size_t n = group.size();
            std::vector<double> comparisons(n), accesses(n), allocations(n), nanos(n), millis(n);
            for (size_t i = 0; i < n; ++i) {
                const RunRecord& r = *group[i];
                comparisons[i] = static_cast<double>(r.comparisons);
                accesses[i]    = static_cast<double>(r.elementAccesses);
                allocations[i] = static_cast<double>(r.allocations);
                nanos[i]       = static_cast<double>(r.elapsedNanos());
                millis[i]      = r.elapsedMillis();
            }

            AggregateStats stats;
            stats.count           = n;
            stats.comparisons     = summarize(comparisons);
            stats.elementAccesses = summarize(accesses);
            stats.allocations     = summarize(allocations);
            stats.elapsedNanos    = summarize(nanos);
            stats.elapsedMillis   = summarize(millis);
            return stats;
        }

    } // namespace detail

    inline AggregateStats aggregateAll(std::span<const RunRecord> records) {
        std::vector<const RunRecord*> all;
        all.reserve(records.size());
        for (const auto& r : records) {
            all.push_back(&r);
        }
        return detail::reduceGroup(all);
    }

    template<typename KeyFn>
    std::map<GroupKeyOf<KeyFn>, AggregateStats> aggregate(std::span<const RunRecord> records, KeyFn&& keyFn) {
        std::map<GroupKeyOf<KeyFn>, std::vector<const RunRecord*>> groups;
        for (const auto& r : records) {
            groups[std::invoke(keyFn, r)].push_back(&r);
        }

        std::map<GroupKeyOf<KeyFn>, AggregateStats> result;
        for (const auto& [key, group] : groups) {
            result.emplace(key, detail::reduceGroup(group));
        }
        return result;
    }

    inline std::map<GroupKey, AggregateStats> aggregate(std::span<const RunRecord> records) {
        return aggregate(records, groupBySizeAndType);
    }

} // namespace kadane
