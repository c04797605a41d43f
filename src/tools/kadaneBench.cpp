/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file kadaneBench.cpp
 * @brief CLI tool running the maximum-subarray benchmark matrix
 *
 * Runs every (size, distribution) configuration for the selected algorithm(s),
 * validates each result, prints a summary and a complexity table, and
 * optionally exports the results as CSV files.
 *
 * Default: sizes 100,1000,10000,100000, six distributions, 3 warmup and
 *          5 measured iterations, baseline algorithm, seed 42, CSV export on.
 */

#include <iostream>
#include <string>
#include <stdexcept>
#include <kadane/kadane.h>
#include "cli_common.h"

// ── Configuration ───────────────────────────────────────────────────

struct Config {
    kadane::BenchmarkConfig bench;
    bool                    help = false;
};

// ── Usage ───────────────────────────────────────────────────────────

static void printUsage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [OPTIONS]\n\n"

        << "Benchmark the maximum-subarray scan over sizes and input distributions.\n\n"

        << "Matrix:\n"
        << "  -s, --sizes LIST         Comma separated input sizes (default: 100,1000,10000,100000)\n"
        << "  -d, --distributions LIST Comma separated distributions (default: random,sorted,\n"
        << "                           reverse_sorted,all_positive,all_negative,alternating)\n"
        << "                           Also available: sparse_positive\n"
        << "  -a, --algorithm NAME     baseline (default), optimized or both\n\n"

        << "Measurement:\n"
        << "  -w, --warmup N           Warmup iterations per warmup size (default: 3, 0 = off)\n"
        << "  -n, --iterations N       Measured iterations per configuration (default: 5)\n"
        << "  --seed N                 Generator seed (default: 42)\n\n"

        << "Output:\n"
        << "  -o, --output-dir DIR     Directory for CSV exports (default: .)\n"
        << "  --export-csv             Export CSV files (default)\n"
        << "  --no-export              Do not export CSV files\n\n"

        << "General:\n"
        << "  -v, --verbose            Verbose progress output\n"
        << "  -h, --help               Show this help message\n\n"

        << "Examples:\n"
        << "  " << prog << "\n"
        << "  " << prog << " --sizes 1000,10000 --distributions random,sorted -n 10\n"
        << "  " << prog << " -a both --no-export\n"
        << "  " << prog << " -o results --distributions sparse_positive -v\n";
}

// ── Argument parsing ────────────────────────────────────────────────

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    auto& b = cfg.bench;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.help = true;
            return cfg;
        } else if (arg == "-v" || arg == "--verbose") {
            b.verbose = true;
        } else if (arg == "--export-csv") {
            b.exportCsv = true;
        } else if (arg == "--no-export") {
            b.exportCsv = false;
        } else if (arg == "-s" || arg == "--sizes") {
            b.sizes = kadane_cli::parseSizeList(kadane_cli::optionValue(argc, argv, i));
        } else if (arg == "-d" || arg == "--distributions") {
            b.distributions = kadane_cli::parseDistributionList(kadane_cli::optionValue(argc, argv, i));
        } else if (arg == "-a" || arg == "--algorithm") {
            b.algorithm = kadane::algorithmSelectionFromString(kadane_cli::optionValue(argc, argv, i));
        } else if (arg == "-w" || arg == "--warmup") {
            b.warmupIterations = kadane_cli::parseCount(kadane_cli::optionValue(argc, argv, i), "warmup count");
        } else if (arg == "-n" || arg == "--iterations") {
            b.iterations = kadane_cli::parsePositive(kadane_cli::optionValue(argc, argv, i), "iteration count");
        } else if (arg == "--seed") {
            const size_t seed = kadane_cli::parseCount(kadane_cli::optionValue(argc, argv, i), "seed");
            if (seed > UINT32_MAX) {
                throw kadane::ConfigurationError("Seed must fit in 32 bits.");
            }
            b.seed = static_cast<uint32_t>(seed);
        } else if (arg == "-o" || arg == "--output-dir") {
            b.outputDir = kadane_cli::optionValue(argc, argv, i);
        } else if (arg.starts_with("-")) {
            throw kadane::ConfigurationError("Unknown option: " + arg);
        } else {
            throw kadane::ConfigurationError("Unexpected argument: " + arg);
        }
    }

    kadane::validateConfig(b);
    return cfg;
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.help) {
            printUsage(argv[0]);
            return 0;
        }

        std::cerr << "Kadane's Algorithm Benchmark Runner (v" << kadane::getVersion() << ")\n"
                  << "===================================\n";

        kadane::BenchmarkRunner runner(cfg.bench, std::cerr);
        runner.printConfiguration(std::cerr);
        runner.run();

        std::cerr << "\nBenchmark completed successfully!\n";
        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
