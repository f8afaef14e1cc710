#pragma once

#include "GeneratorBinding.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <istream>
#include <memory>
#include <streambuf>

/**
 * Lazily renders rows [row_begin, end) of a bound table as CSV.
 *
 * Rows are generated only when the reader runs out of buffered bytes, at most
 * refill_bytes worth at a time. Single pass and not seekable.
 */
class CSVRowsStreamBuf : public std::streambuf {
public:
    static constexpr size_t refill_bytes = 64 * 1024;

    CSVRowsStreamBuf(std::shared_ptr<const ResolvedGenerator> generator, int64_t row_begin, int64_t row_end);

    CSVRowsStreamBuf(const CSVRowsStreamBuf&) = delete;
    CSVRowsStreamBuf& operator=(const CSVRowsStreamBuf&) = delete;

    // Exclusive end row, or Table::unbounded when the stream never ends
    static int64_t resolve_end(int64_t row_end, int64_t row_count);

    int64_t next_row() const { return cursor_; }
    int64_t end_row() const { return end_; }
    int64_t rows_generated() const { return rows_generated_; }

protected:
    int_type underflow() override;

private:
    bool refill();

    std::shared_ptr<const ResolvedGenerator> generator_;
    int64_t cursor_;
    int64_t end_;
    int64_t rows_generated_ = 0;
    bool done_ = false;
    fmt::memory_buffer buffer_;
};

class CSVRowsReader : public std::istream {
public:
    CSVRowsReader(std::shared_ptr<const ResolvedGenerator> generator, int64_t row_begin, int64_t row_end);

    const CSVRowsStreamBuf& rows() const { return buf_; }

private:
    CSVRowsStreamBuf buf_;
};
