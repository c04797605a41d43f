/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the KADANE library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file csv_export_test.cpp
 * @brief Tests for CsvWriter and the RunHistory CSV exports
 *
 * Test categories:
 *   1. CsvWriter formatting (integers, fixed doubles, RFC 4180 quoting)
 *   2. CsvWriter error signaling (closed writer, column mismatch, existing file)
 *   3. Run / summary / complexity CSV content
 *   4. File exports (runs, combined, failure leaves history intact)
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <kadane/kadane.h>

namespace fs = std::filesystem;
using namespace kadane;

namespace {

RunRecord makeRecord(size_t size, std::string type, uint64_t comparisons, std::chrono::nanoseconds elapsed,
                     std::string algorithm = ALGORITHM_BASELINE) {
    RunRecord r;
    r.algorithm       = std::move(algorithm);
    r.timestamp       = 1700000000000;
    r.inputSize       = size;
    r.inputType       = std::move(type);
    r.comparisons     = comparisons;
    r.elementAccesses = size;
    r.allocations     = 0;
    r.elapsed         = elapsed;
    return r;
}

std::vector<std::string> readLines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

// ============================================================================
// Test fixture
// ============================================================================

class CsvExportTest : public ::testing::Test {
protected:
    fs::path tmpDir_;

    void SetUp() override {
        // Per-test subdirectory prevents parallel TearDown races.
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = fs::temp_directory_path() / "kadane_csv_test"
                  / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tmpDir_, ec);
    }

    fs::path tmpFile(const std::string& name) const {
        return tmpDir_ / name;
    }
};

// ============================================================================
// 1. CsvWriter formatting
// ============================================================================

TEST_F(CsvExportTest, WriterFormatsCells) {
    std::ostringstream os;
    CsvWriter writer({"a", "b", "c", "d"});
    ASSERT_TRUE(writer.open(os));
    writer.writeRow({int64_t{-5}, uint64_t{7}, 1.5, std::string("plain")});
    writer.close();

    EXPECT_EQ(os.str(), "a,b,c,d\n-5,7,1.500000,plain\n");
    EXPECT_EQ(writer.rowCount(), 1u);
    EXPECT_FALSE(writer.isOpen());
}

TEST_F(CsvExportTest, WriterQuotesSpecialStrings) {
    std::ostringstream os;
    CsvWriter writer({"text"});
    ASSERT_TRUE(writer.open(os));
    writer.writeRow({std::string("x,y")});
    writer.writeRow({std::string("he said \"hi\"")});
    writer.writeRow({std::string("two\nlines")});
    writer.close();

    EXPECT_EQ(os.str(), "text\n\"x,y\"\n\"he said \"\"hi\"\"\"\n\"two\nlines\"\n");
}

TEST_F(CsvExportTest, WriterHonoursDelimiterAndPrecision) {
    std::ostringstream os;
    CsvWriter writer({"x", "y"}, ';', 2);
    ASSERT_TRUE(writer.open(os));
    writer.writeRow({0.126, std::string("a;b")});
    writer.setPrecision(0);
    writer.writeRow({2.0, std::string("c,d")});
    writer.close();

    EXPECT_EQ(os.str(), "x;y\n0.13;\"a;b\"\n2;c,d\n");
}

TEST_F(CsvExportTest, WriterWithoutHeader) {
    std::ostringstream os;
    CsvWriter writer({"n"});
    ASSERT_TRUE(writer.open(os, false));
    writer.writeRow({uint64_t{42}});
    writer.close();
    EXPECT_EQ(os.str(), "42\n");
}

// ============================================================================
// 2. CsvWriter error signaling
// ============================================================================

TEST_F(CsvExportTest, WriteOnClosedWriterThrows) {
    CsvWriter writer({"a"});
    EXPECT_THROW(writer.writeRow({int64_t{1}}), std::runtime_error);
}

TEST_F(CsvExportTest, ColumnCountMismatchThrows) {
    std::ostringstream os;
    CsvWriter writer({"a", "b"});
    ASSERT_TRUE(writer.open(os));
    EXPECT_THROW(writer.writeRow({int64_t{1}}), std::invalid_argument);
    EXPECT_EQ(writer.rowCount(), 0u);
}

TEST_F(CsvExportTest, OpenRefusesExistingFileWithoutOverwrite) {
    const auto path = tmpFile("exists.csv");
    { std::ofstream(path) << "old\n"; }

    CsvWriter writer({"a"});
    EXPECT_FALSE(writer.open(path, false));
    EXPECT_FALSE(writer.getErrorMsg().empty());
    EXPECT_FALSE(writer.isOpen());
    EXPECT_EQ(readLines(path), (std::vector<std::string>{"old"}));

    EXPECT_TRUE(writer.open(path, true));
    EXPECT_TRUE(writer.getErrorMsg().empty());
    writer.writeRow({int64_t{1}});
    writer.close();
    EXPECT_EQ(readLines(path), (std::vector<std::string>{"a", "1"}));
}

TEST_F(CsvExportTest, OpenCreatesParentDirectories) {
    const auto path = tmpDir_ / "nested" / "deeper" / "out.csv";
    CsvWriter writer({"a"});
    ASSERT_TRUE(writer.open(path));
    writer.close();
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(CsvExportTest, OpenTwiceFails) {
    std::ostringstream os;
    CsvWriter writer({"a"});
    ASSERT_TRUE(writer.open(os));
    EXPECT_FALSE(writer.open(os));
    EXPECT_FALSE(writer.getErrorMsg().empty());
}

// ============================================================================
// 3. Export content
// ============================================================================

TEST_F(CsvExportTest, RunsCsvHeaderAndRow) {
    std::vector<RunRecord> records = {
        makeRecord(9, "random", 16, std::chrono::nanoseconds(1500)),
    };
    std::ostringstream os;
    writeRunsCsv(os, records);

    const auto lines = splitLines(os.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "algorithm,timestamp,inputSize,inputType,comparisons,"
                        "elementAccesses,allocations,elapsedNanos,elapsedMillis");
    EXPECT_EQ(lines[1], "KadaneAlgorithm,1700000000000,9,random,16,9,0,1500,0.001500");
}

TEST_F(CsvExportTest, RunsCsvKeepsInsertionOrder) {
    std::vector<RunRecord> records = {
        makeRecord(300, "sorted", 598, std::chrono::microseconds(3)),
        makeRecord(100, "random", 198, std::chrono::microseconds(1)),
        makeRecord(200, "alternating", 398, std::chrono::microseconds(2)),
    };
    std::ostringstream os;
    writeRunsCsv(os, records);

    const auto lines = splitLines(os.str());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1].substr(0, 34), "KadaneAlgorithm,1700000000000,300,");
    EXPECT_EQ(lines[2].substr(0, 34), "KadaneAlgorithm,1700000000000,100,");
    EXPECT_EQ(lines[3].substr(0, 34), "KadaneAlgorithm,1700000000000,200,");
}

TEST_F(CsvExportTest, SummaryCsvOneRowPerGroup) {
    std::vector<RunRecord> records = {
        makeRecord(100, "sorted", 198, std::chrono::milliseconds(4)),
        makeRecord(9,   "random", 16,  std::chrono::milliseconds(1)),
        makeRecord(9,   "random", 16,  std::chrono::milliseconds(3)),
    };
    std::ostringstream os;
    writeSummaryCsv(os, records);

    const auto lines = splitLines(os.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "inputSize,inputType,avgComparisons,avgAccesses,avgAllocations,"
                        "avgTimeMillis,minTimeMillis,maxTimeMillis");
    EXPECT_EQ(lines[1], "9,random,16.000000,9.000000,0.000000,2.000000,1.000000,3.000000");
    EXPECT_EQ(lines[2], "100,sorted,198.000000,100.000000,0.000000,4.000000,4.000000,4.000000");
}

TEST_F(CsvExportTest, SummaryCsvOfEmptyHistoryIsHeaderOnly) {
    std::ostringstream os;
    writeSummaryCsv(os, {});
    EXPECT_EQ(splitLines(os.str()).size(), 1u);
}

TEST_F(CsvExportTest, ComplexityCsvComparesAgainstLinearModel) {
    std::vector<RunRecord> records = {
        makeRecord(1000, "random", 1998, std::chrono::milliseconds(1)),
    };
    std::ostringstream os;
    writeComplexityCsv(os, records, LinearModel{2.0});

    const auto lines = splitLines(os.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "algorithm,inputSize,inputType,actualTimeMillis,theoreticalTimeMillis,"
                        "actualComparisons,theoreticalComparisons");
    EXPECT_EQ(lines[1], "KadaneAlgorithm,1000,random,1.000000,0.002000,1998,1998");
}

TEST_F(CsvExportTest, ComplexityCsvLeavesUncountedComparisonsEmpty) {
    std::vector<RunRecord> records = {
        makeRecord(1000, "random", 0, std::chrono::milliseconds(1), ALGORITHM_OPTIMIZED),
    };
    std::ostringstream os;
    writeComplexityCsv(os, records, LinearModel{2.0});

    const auto lines = splitLines(os.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "KadaneAlgorithmOptimized,1000,random,1.000000,0.002000,,");
}

TEST_F(CsvExportTest, CalibrationUsesBaselineRecords) {
    std::vector<RunRecord> records = {
        makeRecord(1000, "random", 1998, std::chrono::microseconds(2)),
        makeRecord(1000, "random", 1998, std::chrono::microseconds(4)),
        makeRecord(1000, "random", 0, std::chrono::microseconds(100), ALGORITHM_OPTIMIZED),
    };
    EXPECT_DOUBLE_EQ(calibrateLinearModel(records).nanosPerElement, 3.0);

    std::vector<RunRecord> optimizedOnly = {
        makeRecord(100, "sorted", 0, std::chrono::nanoseconds(500), ALGORITHM_OPTIMIZED),
    };
    EXPECT_DOUBLE_EQ(calibrateLinearModel(optimizedOnly).nanosPerElement, 5.0);

    EXPECT_DOUBLE_EQ(calibrateLinearModel({}).nanosPerElement, LinearModel{}.nanosPerElement);
}

TEST_F(CsvExportTest, LinearModel) {
    LinearModel model{0.5};
    EXPECT_EQ(model.comparisons(1), 0u);
    EXPECT_EQ(model.comparisons(100), 198u);
    EXPECT_DOUBLE_EQ(model.timeMillis(2'000'000), 1.0);
}

// ============================================================================
// 4. File exports
// ============================================================================

TEST_F(CsvExportTest, ExportRunsFromRecordedHistory) {
    RunHistory history;
    RunRecorder recorder(history, ALGORITHM_BASELINE);
    MetricsCounter metrics;
    ArrayGenerator gen;

    for (size_t n : {10u, 20u, 30u}) {
        const auto values = gen.generate(n, Distribution::RANDOM);
        scan(values, metrics);
        recorder.record(metrics, n, "random");
    }

    const auto path = tmpFile("runs.csv");
    exportRunsCsv(history, path);

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].substr(0, 10), "algorithm,");
    EXPECT_NE(lines[2].find(",20,random,38,20,0,"), std::string::npos);
}

TEST_F(CsvExportTest, ExportFailureLeavesHistoryIntact) {
    RunHistory history;
    history.append(makeRecord(9, "random", 16, std::chrono::nanoseconds(10)));

    const auto path = tmpFile("taken.csv");
    { std::ofstream(path) << "keep\n"; }

    EXPECT_THROW(exportRunsCsv(history, path, false), std::runtime_error);
    EXPECT_THROW(exportSummaryCsv(history, path, false), std::runtime_error);
    EXPECT_EQ(history.size(), 1u);
    EXPECT_EQ(readLines(path), (std::vector<std::string>{"keep"}));
}

TEST_F(CsvExportTest, ExportSummaryAndComplexityFiles) {
    RunHistory history;
    history.append(makeRecord(100, "random", 198, std::chrono::milliseconds(2)));
    history.append(makeRecord(100, "random", 198, std::chrono::milliseconds(4)));

    exportSummaryCsv(history, tmpFile("summary.csv"));
    exportComplexityCsv(history, tmpFile("complexity.csv"));

    const auto summary = readLines(tmpFile("summary.csv"));
    ASSERT_EQ(summary.size(), 2u);
    EXPECT_EQ(summary[1], "100,random,198.000000,100.000000,0.000000,3.000000,2.000000,4.000000");

    const auto complexity = readLines(tmpFile("complexity.csv"));
    ASSERT_EQ(complexity.size(), 3u);
    EXPECT_EQ(complexity[1], "KadaneAlgorithm,100,random,2.000000,0.000100,198,198");
}

TEST_F(CsvExportTest, CombinedExportConcatenatesHistories) {
    RunHistory first;
    RunHistory second;
    first.append(makeRecord(10, "random", 18, std::chrono::nanoseconds(1)));
    second.append(makeRecord(20, "sorted", 0, std::chrono::nanoseconds(2), ALGORITHM_OPTIMIZED));
    second.append(makeRecord(30, "sorted", 0, std::chrono::nanoseconds(3), ALGORITHM_OPTIMIZED));

    const auto path = tmpFile("combined.csv");
    exportCombinedCsv({&first, &second}, path);

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "algorithm,timestamp,inputSize,inputType,comparisons,"
                        "elementAccesses,allocations,elapsedNanos,elapsedMillis");
    EXPECT_EQ(lines[1].substr(0, 16), "KadaneAlgorithm,");
    EXPECT_EQ(lines[2].substr(0, 25), "KadaneAlgorithmOptimized,");
    EXPECT_NE(lines[3].find(",30,sorted,"), std::string::npos);
}
