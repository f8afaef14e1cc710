#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// std::monostate is SQL NULL
using Datum = std::variant<std::monostate, bool, int64_t, double, std::string>;
using Row = std::vector<Datum>;
