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
 * @file csv_writer.hpp
 * @brief CsvWriter implementations.
 */

#include "csv_writer.h"
#include <charconv>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace kadane {

    // ── Constructor / Destructor ────────────────────────────────────────

    inline CsvWriter::CsvWriter(std::vector<std::string> columns, char delimiter, int precision)
        : columns_(std::move(columns))
        , delimiter_(delimiter)
        , precision_(precision)
    {
        buf_.reserve(512);
    }

    inline CsvWriter::~CsvWriter() {
        // Only close the owned stream; external ostreams stay with the caller
        if (stream_.is_open()) {
            stream_.flush();
            stream_.close();
        }
        os_ = nullptr;
    }

    // ── Lifecycle ───────────────────────────────────────────────────────

    inline void CsvWriter::close() {
        if (os_ == nullptr) {
            return;
        }
        os_->flush();
        if (stream_.is_open()) {
            stream_.close();
        }
        os_ = nullptr;
        file_path_.clear();
    }

    inline bool CsvWriter::open(const FilePath& filepath, bool overwrite, bool includeHeader) {
        err_msg_.clear();

        if (isOpen()) {
            err_msg_ = "Warning: File is already open: " + file_path_.string();
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << err_msg_ << std::endl;
            }
            return false;
        }

        try {
            FilePath absolutePath = std::filesystem::absolute(filepath);

            // Create parent directory if needed
            FilePath parentDir = absolutePath.parent_path();
            if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
                std::error_code ec;
                if (!std::filesystem::create_directories(parentDir, ec)) {
                    err_msg_ = "Error: Cannot create directory: " + parentDir.string() +
                               " (Error: " + ec.message() + ")";
                    throw std::runtime_error(err_msg_);
                }
            }

            if (std::filesystem::exists(absolutePath) && !overwrite) {
                err_msg_ = "Warning: File already exists: " + absolutePath.string() +
                           ". Use overwrite=true to replace it.";
                throw std::runtime_error(err_msg_);
            }

            stream_.open(absolutePath, std::ios::out | std::ios::trunc);
            if (!stream_.good()) {
                err_msg_ = "Error: Cannot open file for writing: " + absolutePath.string();
                throw std::runtime_error(err_msg_);
            }

            os_ = &stream_;
            file_path_ = absolutePath;
            row_cnt_ = 0;

            if (includeHeader) {
                writeHeader();
            }
            return true;

        } catch (const std::filesystem::filesystem_error& ex) {
            if (err_msg_.empty()) {
                err_msg_ = std::string("Filesystem error: ") + ex.what();
            }
        } catch (const std::runtime_error& ex) {
            if (err_msg_.empty()) {
                err_msg_ = ex.what();
            }
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << err_msg_ << std::endl;
        }
        if (stream_.is_open()) {
            stream_.close();
        }
        os_ = nullptr;
        return false;
    }

    inline bool CsvWriter::open(std::ostream& os, bool includeHeader) {
        err_msg_.clear();
        if (isOpen()) {
            err_msg_ = "Warning: Writer is already open";
            return false;
        }
        os_ = &os;
        file_path_.clear();
        row_cnt_ = 0;
        if (includeHeader) {
            writeHeader();
        }
        return true;
    }

    // ── Writing ─────────────────────────────────────────────────────────

    inline void CsvWriter::writeHeader() {
        buf_.clear();
        for (size_t i = 0; i < columns_.size(); ++i) {
            if (i > 0) buf_.push_back(delimiter_);
            appendString(columns_[i]);
        }
        flushLine();
    }

    inline void CsvWriter::writeRow(const std::vector<CsvValue>& values) {
        if (os_ == nullptr) {
            throw std::runtime_error("CsvWriter::writeRow() called on a closed writer");
        }
        if (values.size() != columns_.size()) {
            throw std::invalid_argument("CsvWriter::writeRow() expected " + std::to_string(columns_.size()) +
                                        " values, got " + std::to_string(values.size()));
        }

        buf_.clear();
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) buf_.push_back(delimiter_);
            std::visit([this](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    appendString(value);
                } else if constexpr (std::is_same_v<T, double>) {
                    appendDouble(value);
                } else {
                    appendToChars(value);
                }
            }, values[i]);
        }
        flushLine();
        ++row_cnt_;
    }

    inline void CsvWriter::flushLine() {
        buf_.push_back('\n');
        os_->write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        if (!os_->good()) {
            err_msg_ = "Error: Write failed" + (file_path_.empty() ? std::string() : ": " + file_path_.string());
            throw std::runtime_error(err_msg_);
        }
    }

    template<typename T>
    void CsvWriter::appendToChars(T value) {
        constexpr size_t kMaxDigits = 24;
        const size_t oldSize = buf_.size();
        buf_.resize(oldSize + kMaxDigits);
        auto [ptr, ec] = std::to_chars(buf_.data() + oldSize, buf_.data() + oldSize + kMaxDigits, value);
        buf_.resize(static_cast<size_t>(ptr - buf_.data()));
    }

    inline void CsvWriter::appendDouble(double value) {
        // Fixed notation of the largest doubles needs ~310 digits before the point
        const size_t maxChars = 320 + static_cast<size_t>(precision_ > 0 ? precision_ : 0);
        const size_t oldSize = buf_.size();
        buf_.resize(oldSize + maxChars);
        auto [ptr, ec] = std::to_chars(buf_.data() + oldSize, buf_.data() + oldSize + maxChars,
                                       value, std::chars_format::fixed, precision_);
        if (ec != std::errc{}) {
            ptr = buf_.data() + oldSize;
        }
        buf_.resize(static_cast<size_t>(ptr - buf_.data()));
    }

    inline void CsvWriter::appendString(const std::string& value) {
        bool needsQuoting = false;
        for (char c : value) {
            if (c == delimiter_ || c == '"' || c == '\n' || c == '\r') {
                needsQuoting = true;
                break;
            }
        }

        if (needsQuoting) {
            buf_.push_back('"');
            for (char c : value) {
                if (c == '"') buf_.push_back('"');
                buf_.push_back(c);
            }
            buf_.push_back('"');
        } else {
            buf_.insert(buf_.end(), value.begin(), value.end());
        }
    }

} // namespace kadane
