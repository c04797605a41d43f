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
 * @file cli_common.h
 * @brief Shared utilities for KADANE CLI tools
 *
 * Provides standardised helpers used across the CLI tools:
 *   - optionValue()            : value following a command-line option
 *   - splitList()              : "a,b,c" → {"a", "b", "c"} (blanks trimmed, empties dropped)
 *   - parsePositive()          : decimal string → size_t > 0
 *   - parseCount()             : decimal string → size_t >= 0
 *   - parseSizeList()          : "--sizes" string → sizes
 *   - parseDistributionList()  : "--distributions" string → Distribution list
 *   - parseIntegers()          : whitespace/comma separated integers → int32 values
 *   - formatDuration()         : nanoseconds → "1.23 ms" / "456 us" / "789 ns"
 *
 * Parsing failures throw kadane::ConfigurationError.
 */

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <istream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <kadane/kadane.h>

namespace kadane_cli {

// ── optionValue ────────────────────────────────────────────────────

/// Return the value following argv[i] and advance i past it.
/// Throws ConfigurationError when the option is the last argument.
inline std::string optionValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw kadane::ConfigurationError("Missing value for " + std::string(argv[i]));
    }
    return argv[++i];
}

// ── splitList ──────────────────────────────────────────────────────

/// Split a comma separated list. Surrounding blanks are trimmed and empty items dropped.
inline std::vector<std::string> splitList(std::string_view text, char sep = ',') {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t next = text.find(sep, pos);
        if (next == std::string_view::npos) next = text.size();

        std::string_view item = text.substr(pos, next - pos);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.remove_prefix(1);
        while (!item.empty() && (item.back()  == ' ' || item.back()  == '\t')) item.remove_suffix(1);
        if (!item.empty()) items.emplace_back(item);

        pos = next + 1;
    }
    return items;
}

// ── Numbers ────────────────────────────────────────────────────────

/// Parse a non-negative decimal count. Throws ConfigurationError naming `what`.
inline size_t parseCount(std::string_view text, const std::string& what) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw kadane::ConfigurationError("Invalid " + what + ": '" + std::string(text) + "'");
    }
    return value;
}

/// Parse a positive decimal count. Throws ConfigurationError naming `what`.
inline size_t parsePositive(std::string_view text, const std::string& what) {
    const size_t value = parseCount(text, what);
    if (value == 0) {
        throw kadane::ConfigurationError(what + " must be positive.");
    }
    return value;
}

/// Parse "--sizes 100,1000,10000".
inline std::vector<size_t> parseSizeList(std::string_view text) {
    std::vector<size_t> sizes;
    for (const auto& item : splitList(text)) {
        sizes.push_back(parsePositive(item, "size"));
    }
    if (sizes.empty()) {
        throw kadane::ConfigurationError("Size list is empty.");
    }
    return sizes;
}

/// Parse "--distributions random,sorted".
inline std::vector<kadane::Distribution> parseDistributionList(std::string_view text) {
    std::vector<kadane::Distribution> dists;
    for (const auto& item : splitList(text)) {
        dists.push_back(kadane::distributionFromString(item));
    }
    if (dists.empty()) {
        throw kadane::ConfigurationError("Distribution list is empty.");
    }
    return dists;
}

/// Parse one signed 32-bit integer.
inline int32_t parseInt32(std::string_view text) {
    int32_t value = 0;
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        throw kadane::ConfigurationError("Value out of 32-bit range: '" + std::string(text) + "'");
    }
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw kadane::ConfigurationError("Invalid integer: '" + std::string(text) + "'");
    }
    return value;
}

/// Read integers separated by blanks, commas or newlines until end of stream.
inline std::vector<int32_t> parseIntegers(std::istream& in) {
    std::vector<int32_t> values;
    std::string token;
    while (in >> token) {
        for (const auto& item : splitList(token)) {
            values.push_back(parseInt32(item));
        }
    }
    return values;
}

// ── formatDuration ─────────────────────────────────────────────────

/// Format a duration with a unit that keeps 1-3 integer digits.
inline std::string formatDuration(std::chrono::nanoseconds d) {
    const auto ns = d.count();
    std::ostringstream oss;
    if (ns >= 1'000'000'000) {
        oss << std::fixed << std::setprecision(2) << (static_cast<double>(ns) / 1e9) << " s";
    } else if (ns >= 1'000'000) {
        oss << std::fixed << std::setprecision(2) << (static_cast<double>(ns) / 1e6) << " ms";
    } else if (ns >= 1'000) {
        oss << std::fixed << std::setprecision(2) << (static_cast<double>(ns) / 1e3) << " us";
    } else {
        oss << ns << " ns";
    }
    return oss.str();
}

} // namespace kadane_cli
