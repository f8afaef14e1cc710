#pragma once

#include "Datum.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <vector>

class CsvEncoder {
public:
    static constexpr char delimiter = ',';
    static constexpr const char* null_text = "NULL";

    // Appends one field, quoting text only when needed
    static void append_field(fmt::memory_buffer& out, const Datum& value);

    // Appends fields joined by ',' and a trailing '\n'
    static void append_record(fmt::memory_buffer& out, const Row& row);
    static void append_header(fmt::memory_buffer& out, const std::vector<std::string>& columns);

    static std::string encode_record(const Row& row);

    static bool needs_quotes(std::string_view field);
};
