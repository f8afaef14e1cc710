#include "CsvEncoder.hpp"
#include <iterator>
#include <type_traits>
#include <variant>

bool CsvEncoder::needs_quotes(std::string_view field) {
    if (field.empty()) {
        return false;
    }
    if (field == "\\.") {
        return true;
    }
    if (field[0] == ' ' || field[0] == '\t') {
        return true;
    }
    return field.find_first_of(",\"\r\n") != std::string_view::npos;
}

static inline void append_text(fmt::memory_buffer& out, std::string_view s) {
    if (!CsvEncoder::needs_quotes(s)) {
        out.append(s.data(), s.data() + s.size());
        return;
    }

    out.push_back('"');
    for (char ch : s) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
}

void CsvEncoder::append_field(fmt::memory_buffer& out, const Datum& value) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            fmt::format_to(std::back_inserter(out), "{}", null_text);
        } else if constexpr (std::is_same_v<T, bool>) {
            fmt::format_to(std::back_inserter(out), "{}", v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            append_text(out, v);
        } else {
            fmt::format_to(std::back_inserter(out), "{}", v);
        }
    }, value);
}

void CsvEncoder::append_record(fmt::memory_buffer& out, const Row& row) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out.push_back(delimiter);
        append_field(out, row[i]);
    }
    out.push_back('\n');
}

void CsvEncoder::append_header(fmt::memory_buffer& out, const std::vector<std::string>& columns) {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out.push_back(delimiter);
        append_text(out, columns[i]);
    }
    out.push_back('\n');
}

std::string CsvEncoder::encode_record(const Row& row) {
    fmt::memory_buffer out;
    append_record(out, row);
    return fmt::to_string(out);
}
