#include "CSVRowsReader.hpp"
#include "CsvEncoder.hpp"
#include "BuiltinGenerators.hpp"
#include "GeneratorBinding.hpp"
#include "WorkloadConfigParser.hpp"
#include <cassert>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static std::shared_ptr<const ResolvedGenerator> bind_uri(const std::string& uri) {
    return GeneratorBinding::bind(WorkloadConfigParser::parse(uri));
}

static std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static size_t count_lines(const std::string& s) {
    size_t n = 0;
    for (char ch : s) {
        if (ch == '\n') ++n;
    }
    return n;
}

void test_resolve_end() {
    assert(CSVRowsStreamBuf::resolve_end(0, 100) == 100);
    assert(CSVRowsStreamBuf::resolve_end(10, 100) == 10);
    assert(CSVRowsStreamBuf::resolve_end(500, 100) == 100);
    assert(CSVRowsStreamBuf::resolve_end(0, Table::unbounded) == Table::unbounded);
    assert(CSVRowsStreamBuf::resolve_end(25, Table::unbounded) == 25);
    std::cout << "test_resolve_end passed.\n";
}

void test_reads_exact_range() {
    auto gen = bind_uri("workload:///csv/bank/accounts?version=1.0.0&payload-bytes=6");
    CSVRowsReader reader(gen, 0, 10);
    const std::string content = read_all(reader);

    std::string expected;
    for (int64_t i = 0; i < 10; ++i) {
        expected += CsvEncoder::encode_record(gen->table().row(i));
    }
    assert(content == expected);
    assert(count_lines(content) == 10);
    assert(content.compare(0, 4, "0,0,") == 0);
    assert(reader.rows().rows_generated() == 10);
    assert(reader.rows().next_row() == 10);
    std::cout << "test_reads_exact_range passed.\n";
}

void test_offset_range_and_row_count_cap() {
    auto gen = bind_uri("workload:///csv/bank/accounts?version=1.0.0&rows=12&payload-bytes=2");

    CSVRowsReader middle(gen, 5, 8);
    std::string content = read_all(middle);
    assert(count_lines(content) == 3);
    assert(content.compare(0, 2, "5,") == 0);

    // Unbounded end stops at the table's row count
    CSVRowsReader to_end(gen, 9, 0);
    assert(count_lines(read_all(to_end)) == 3);

    // An end past the row count is capped
    CSVRowsReader capped(gen, 0, 1000);
    assert(count_lines(read_all(capped)) == 12);

    // Begin at or past the end is empty
    CSVRowsReader empty(gen, 12, 0);
    assert(read_all(empty).empty());
    std::cout << "test_offset_range_and_row_count_cap passed.\n";
}

void test_large_range_spans_refills() {
    auto gen = bind_uri("workload:///csv/bank/accounts?version=1.0.0&rows=5000&payload-bytes=100");
    CSVRowsReader reader(gen, 0, 0);

    std::vector<char> chunk(4096);
    size_t total = 0;
    size_t lines = 0;
    while (reader.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || reader.gcount() > 0) {
        const auto got = static_cast<size_t>(reader.gcount());
        for (size_t i = 0; i < got; ++i) {
            if (chunk[i] == '\n') ++lines;
        }
        total += got;
    }
    assert(lines == 5000);
    assert(total > CSVRowsStreamBuf::refill_bytes);
    assert(reader.eof());
    std::cout << "test_large_range_spans_refills passed.\n";
}

void test_unbounded_stream_is_lazy() {
    auto gen = bind_uri("workload:///csv/meters/meters?version=0.5.0&devices=2");
    CSVRowsReader reader(gen, 0, 0);
    assert(reader.rows().end_row() == Table::unbounded);

    std::string line;
    for (int i = 0; i < 5; ++i) {
        assert(std::getline(reader, line));
        assert(line.compare(0, 1, "d") == 0);
    }
    // One refill of ~50 byte rows, nowhere near a second one
    assert(reader.rows().rows_generated() > 5);
    assert(reader.rows().rows_generated() < 2000);
    assert(reader.rows().next_row() == reader.rows().rows_generated());
    std::cout << "test_unbounded_stream_is_lazy passed.\n";
}

void test_independent_streams_are_identical() {
    auto gen = bind_uri("workload:///csv/meters/meters?version=0.5.0&devices=4&seed=11");

    std::string first;
    std::string second;
    std::thread t1([&] {
        CSVRowsReader reader(gen, 100, 900);
        first = read_all(reader);
    });
    std::thread t2([&] {
        CSVRowsReader reader(gen, 100, 900);
        second = read_all(reader);
    });
    t1.join();
    t2.join();

    assert(!first.empty());
    assert(first == second);
    assert(count_lines(first) == 800);

    // A fresh stream starts over at row_begin
    CSVRowsReader again(gen, 100, 900);
    assert(read_all(again) == first);
    std::cout << "test_independent_streams_are_identical passed.\n";
}

void test_failing_row_is_not_skipped() {
    // Timestamps of rows past 5 overflow int64
    auto gen = bind_uri("workload:///csv/meters/meters?version=0.5.0&devices=1"
                        "&start-ts=9223372036854770000&interval=1000");
    CSVRowsReader reader(gen, 0, 0);
    reader.exceptions(std::ios::badbit);

    for (int attempt = 0; attempt < 2; ++attempt) {
        bool threw = false;
        try {
            read_all(reader);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);
        assert(reader.rows().next_row() == 0);
        assert(reader.rows().rows_generated() == 0);
        reader.clear();
    }

    // The rows before the failing one are still readable on their own
    CSVRowsReader head(gen, 0, 6);
    assert(count_lines(read_all(head)) == 6);
    std::cout << "test_failing_row_is_not_skipped passed.\n";
}

int main() {
    register_builtin_generators();

    test_resolve_end();
    test_reads_exact_range();
    test_offset_range_and_row_count_cap();
    test_large_range_spans_refills();
    test_unbounded_stream_is_lazy();
    test_independent_streams_are_identical();
    test_failing_row_is_not_skipped();
    std::cout << "All CSVRowsReader tests passed!\n";
    return 0;
}
