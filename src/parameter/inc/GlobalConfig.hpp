#pragma once

#include <cstddef>
#include <string>

struct GlobalConfig {
    bool verbose = false;
    std::string log_dir = "log/";
    std::string log_level = "info";     // Overridden to debug by verbose
    size_t concurrency = 1;             // Exports run in parallel
};
