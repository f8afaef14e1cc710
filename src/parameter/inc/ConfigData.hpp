#pragma once

#include "GlobalConfig.hpp"
#include "ExportConfig.hpp"
#include <vector>

// Top-level config
struct ConfigData {
    GlobalConfig global;
    std::vector<ExportConfig> exports;
    bool list_generators = false;
};
