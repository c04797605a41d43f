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
 * @file csv_writer.h
 * @brief CsvWriter: flat delimited text output for benchmark records.
 *
 * Design:
 *   - Fixed column set given at construction, written as the header line
 *   - Cells are CsvValue variants formatted with std::to_chars (no locale)
 *   - Single os.write() per row (buffered in a reusable char vector)
 *   - RFC 4180 quoting for strings containing delimiter, quotes, or newlines
 *   - Writes to an owned file or to a caller-supplied std::ostream
 *
 * Usage:
 *     kadane::CsvWriter writer({"size", "avg_time_ms"});
 *     if (!writer.open("out/summary.csv", true)) {
 *         throw std::runtime_error(writer.getErrorMsg());
 *     }
 *     writer.writeRow({uint64_t{1000}, 0.042});
 *     writer.close();
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "definitions.h"

namespace kadane {

    using CsvValue = std::variant<int64_t, uint64_t, double, std::string>;

    class CsvWriter {
    public:
        using FilePath = std::filesystem::path;

    private:
        std::string                 err_msg_;               // last error message description
        FilePath                    file_path_;             // path to the output file
        std::ofstream               stream_;                // owned output stream
        std::ostream*               os_ = nullptr;          // active stream (owned or external)

        std::vector<std::string>    columns_;               // header names
        uint64_t                    row_cnt_ = 0;           // data rows written
        char                        delimiter_ = ',';       // field delimiter
        int                         precision_ = 6;         // digits after the decimal point

        std::vector<char>           buf_;                   // reusable per-row serialization buffer

    public:
        CsvWriter() = delete;
        explicit CsvWriter(std::vector<std::string> columns, char delimiter = ',', int precision = 6);
        CsvWriter(const CsvWriter&) = delete;
        CsvWriter& operator=(const CsvWriter&) = delete;
        ~CsvWriter();

        void                        close();
        size_t                      columnCount() const             { return columns_.size(); }
        const std::vector<std::string>& columns() const             { return columns_; }
        char                        delimiter() const               { return delimiter_; }
        const FilePath&             filePath() const                { return file_path_; }
        const std::string&          getErrorMsg() const             { return err_msg_; }
        bool                        isOpen() const                  { return os_ != nullptr; }
        bool                        open(const FilePath& filepath, bool overwrite = false, bool includeHeader = true);
        bool                        open(std::ostream& os, bool includeHeader = true);
        int                         precision() const               { return precision_; }
        size_t                      rowCount() const                { return row_cnt_; }
        void                        setPrecision(int digits)        { precision_ = digits; }
        void                        writeRow(const std::vector<CsvValue>& values);

    private:
        void                        writeHeader();
        void                        flushLine();

        template<typename T>
        void                        appendToChars(T value);

        void                        appendDouble(double value);
        void                        appendString(const std::string& value);
    };

} // namespace kadane
