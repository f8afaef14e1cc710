#pragma once

#include "DataFormat.hpp"
#include <cstdint>
#include <string>
#include <vector>

// A validated request for generated table data. Immutable once parsed.
struct WorkloadConfig {
    DataFormat format = DataFormat::CSV;
    std::string format_name = "csv";     // Path segment as written by the caller
    std::string generator;
    std::string version;                 // Exact-match key, never normalized
    std::string table;
    int64_t row_begin = 0;
    int64_t row_end = 0;                 // 0 = up to the table's row count
    std::vector<std::string> flags;      // "--key=value"

    static constexpr const char* default_scheme = "workload";

    bool row_end_unbounded() const { return row_end == 0; }

    /**
     * Render the config back into a URI that parses to an equal config
     * (flags compare equal as a set).
     */
    std::string to_uri(const std::string& scheme = default_scheme) const;

    // Short form for log lines: "bank.accounts@1.0.0 rows [0, 10)"
    std::string describe() const;

    bool operator==(const WorkloadConfig& other) const;
    bool operator!=(const WorkloadConfig& other) const { return !(*this == other); }
};
