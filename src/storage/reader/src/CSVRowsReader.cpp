#include "CSVRowsReader.hpp"
#include "CsvEncoder.hpp"
#include "LogUtils.hpp"
#include <algorithm>

CSVRowsStreamBuf::CSVRowsStreamBuf(std::shared_ptr<const ResolvedGenerator> generator,
                                   int64_t row_begin, int64_t row_end)
    : generator_(std::move(generator))
    , cursor_(row_begin)
    , end_(resolve_end(row_end, generator_->table().row_count)) {
    setg(nullptr, nullptr, nullptr);
}

int64_t CSVRowsStreamBuf::resolve_end(int64_t row_end, int64_t row_count) {
    if (row_end == 0) {
        return row_count;
    }
    if (row_count >= 0) {
        return std::min(row_end, row_count);
    }
    return row_end;
}

bool CSVRowsStreamBuf::refill() {
    const Table& table = generator_->table();
    setg(nullptr, nullptr, nullptr);
    buffer_.clear();

    // The cursor moves only once the whole chunk is rendered, so a row that
    // throws is produced again by the next read instead of being skipped
    int64_t next = cursor_;
    while (buffer_.size() < refill_bytes) {
        if (end_ != Table::unbounded && next >= end_) {
            break;
        }
        CsvEncoder::append_record(buffer_, table.row(next));
        ++next;
    }
    rows_generated_ += next - cursor_;
    cursor_ = next;

    if (buffer_.size() == 0) {
        done_ = true;
        LogUtils::debug("Row stream over {}.{} finished after {} rows",
                        generator_->meta().name, table.name, rows_generated_);
        return false;
    }

    char* data = buffer_.data();
    setg(data, data, data + buffer_.size());
    return true;
}

CSVRowsStreamBuf::int_type CSVRowsStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (done_ || !refill()) {
        return traits_type::eof();
    }
    return traits_type::to_int_type(*gptr());
}

CSVRowsReader::CSVRowsReader(std::shared_ptr<const ResolvedGenerator> generator,
                             int64_t row_begin, int64_t row_end)
    : std::istream(nullptr)
    , buf_(std::move(generator), row_begin, row_end) {
    rdbuf(&buf_);
}
