#pragma once

#include <string>

enum class DataFormat {
    CSV
};

const char* data_format_to_string(DataFormat format);

// Case-insensitive; throws StorageError(UnsupportedFormat) for anything but "csv"
DataFormat string_to_data_format(const std::string& str);
