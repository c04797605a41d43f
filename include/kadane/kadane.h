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
 * @file kadane.h
 * @brief KADANE Library - Main Header with Declarations
 *
 * A C++20 header-only library computing the maximum-sum contiguous subarray
 * in linear time, with operation counting, run history, statistics and CSV
 * export for empirical complexity checks.
 *
 * This header includes all KADANE component declarations:
 * - MetricsCounter: operation counters and timer (MetricsSink port)
 * - scan / scanOptimized: the maximum-subarray engine
 * - RunHistory / RunRecorder: per-run records
 * - aggregate: grouped statistics over run records
 * - CsvWriter and the CSV exports
 * - ArrayGenerator / BenchmarkRunner: benchmark orchestration
 */

#include <iostream>
#include <string>

// Core definitions first
#include "definitions.h"

// Core component declarations
#include "metrics.h"
#include "max_subarray.h"
#include "run_history.h"
#include "statistics.h"
#include "csv_writer.h"
#include "csv_export.h"
#include "array_generator.h"
#include "benchmark_runner.h"

// Include implementations
#include "metrics.hpp"
#include "max_subarray.hpp"
#include "run_history.hpp"
#include "statistics.hpp"
#include "csv_writer.hpp"
#include "csv_export.hpp"
#include "array_generator.hpp"
#include "benchmark_runner.hpp"
