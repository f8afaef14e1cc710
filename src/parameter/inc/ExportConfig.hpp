#pragma once

#include <string>

// One URI to read and the place its CSV goes
struct ExportConfig {
    std::string uri;
    std::string output = "-";           // "-" is stdout
    bool header = false;

    bool to_stdout() const { return output.empty() || output == "-"; }
};
