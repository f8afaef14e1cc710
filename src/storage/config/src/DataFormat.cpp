#include "DataFormat.hpp"
#include "StorageError.hpp"
#include "StringUtils.hpp"

const char* data_format_to_string(DataFormat format) {
    switch (format) {
        case DataFormat::CSV: return "csv";
        default: return "unknown";
    }
}

DataFormat string_to_data_format(const std::string& str) {
    const std::string s = StringUtils::to_lower(str);
    if (s == "csv") return DataFormat::CSV;
    throw StorageError(StorageErrorCode::UnsupportedFormat, "unsupported format: " + str);
}
