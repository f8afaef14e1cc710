#pragma once

#include "Datum.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct Table {
    static constexpr int64_t unbounded = -1;

    std::string name;
    std::vector<std::string> columns;
    int64_t row_count = unbounded;

    // Pure: the same index always yields the same row, from any thread
    std::function<Row(int64_t)> row;

    bool bounded() const { return row_count >= 0; }
};
