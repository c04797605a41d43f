/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file kadaneScan.cpp
 * @brief CLI tool computing the maximum subarray of a list of integers
 *
 * Values come from positional arguments, from a file (-i) or from stdin
 * when neither is given. Values are separated by blanks, commas or newlines.
 *
 * Output (stdout):
 *     maxSum=6 start=3 end=6 length=4
 *     subarray: 4 -1 2 1
 */

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <vector>
#include <kadane/kadane.h>
#include "cli_common.h"

// ── Configuration ───────────────────────────────────────────────────

struct Config {
    std::string             input_file;
    std::vector<int32_t>    values;
    bool                    wide        = false;
    bool                    optimized   = false;
    bool                    metrics     = false;
    bool                    print_slice = true;
    bool                    help        = false;
};

// ── Usage ───────────────────────────────────────────────────────────

static void printUsage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [OPTIONS] [VALUE ...]\n\n"

        << "Find the maximum-sum contiguous subarray of signed 32-bit integers.\n"
        << "Values are read from the arguments, from a file, or from stdin.\n\n"

        << "Input:\n"
        << "  -i, --input FILE         Read values from FILE\n\n"

        << "Scan:\n"
        << "  --wide                   Accumulate in 64 bits (no wraparound)\n"
        << "  --optimized              Use the optimized scan\n"
        << "  -m, --metrics            Print operation counts and elapsed time (baseline only)\n"
        << "  --no-slice               Do not print the subarray values\n\n"

        << "General:\n"
        << "  -h, --help               Show this help message\n\n"

        << "Examples:\n"
        << "  " << prog << " -- -2 1 -3 4 -1 2 1 -5 4\n"
        << "  " << prog << " --wide -i values.txt\n"
        << "  seq -5 5 | " << prog << " -m\n";
}

// ── Argument parsing ────────────────────────────────────────────────

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    bool positional_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (positional_only) {
            for (const auto& item : kadane_cli::splitList(arg)) {
                cfg.values.push_back(kadane_cli::parseInt32(item));
            }
        } else if (arg == "--") {
            positional_only = true;
        } else if (arg == "-h" || arg == "--help") {
            cfg.help = true;
            return cfg;
        } else if (arg == "--wide") {
            cfg.wide = true;
        } else if (arg == "--optimized") {
            cfg.optimized = true;
        } else if (arg == "-m" || arg == "--metrics") {
            cfg.metrics = true;
        } else if (arg == "--no-slice") {
            cfg.print_slice = false;
        } else if (arg == "-i" || arg == "--input") {
            cfg.input_file = kadane_cli::optionValue(argc, argv, i);
        } else if (arg.size() > 1 && arg[0] == '-' && !(arg[1] >= '0' && arg[1] <= '9')) {
            throw kadane::ConfigurationError("Unknown option: " + arg);
        } else {
            // bare value (negative numbers included)
            for (const auto& item : kadane_cli::splitList(arg)) {
                cfg.values.push_back(kadane_cli::parseInt32(item));
            }
        }
    }

    if (cfg.optimized && cfg.metrics) {
        throw kadane::ConfigurationError("--metrics is only available for the baseline scan.");
    }
    if (!cfg.input_file.empty() && !cfg.values.empty()) {
        throw kadane::ConfigurationError("Give values either as arguments or with --input, not both.");
    }
    return cfg;
}

// ── Output ──────────────────────────────────────────────────────────

template<typename Result>
static void printResult(const Result& result, const std::vector<int32_t>& values, bool printSlice) {
    std::cout << "maxSum=" << result.maxSum
              << " start=" << result.startIndex
              << " end=" << result.endIndex
              << " length=" << result.length() << "\n";

    if (printSlice) {
        if (auto slice = result.subarray(values)) {
            std::cout << "subarray:";
            for (int32_t v : *slice) {
                std::cout << " " << v;
            }
            std::cout << "\n";
        }
    }
}

template<typename Sum>
static void runScan(const Config& cfg, const std::vector<int32_t>& values) {
    if (cfg.optimized) {
        printResult(kadane::scanOptimized<Sum>(values), values, cfg.print_slice);
        return;
    }

    kadane::MetricsCounter metrics;
    auto result = kadane::scan<Sum>(values, metrics);
    printResult(result, values, cfg.print_slice);

    if (cfg.metrics) {
        std::cerr << metrics.toString(cfg.wide ? "scan<int64_t>" : "scan<int32_t>") << "\n"
                  << "Elapsed: " << kadane_cli::formatDuration(metrics.elapsed()) << "\n";
    }
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.help) {
            printUsage(argv[0]);
            return 0;
        }

        std::vector<int32_t> values = std::move(cfg.values);
        if (!cfg.input_file.empty()) {
            std::ifstream in(cfg.input_file);
            if (!in.is_open()) {
                throw std::runtime_error("Cannot open input file: " + cfg.input_file);
            }
            values = kadane_cli::parseIntegers(in);
        } else if (values.empty()) {
            values = kadane_cli::parseIntegers(std::cin);
        }

        if (cfg.wide) {
            runScan<int64_t>(cfg, values);
        } else {
            runScan<int32_t>(cfg, values);
        }
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
