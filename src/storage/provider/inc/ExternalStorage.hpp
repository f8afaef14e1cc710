#pragma once

#include "ExternalStorageConfig.hpp"
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

class ExternalStorage {
public:
    virtual ~ExternalStorage() = default;

    // Configuration this storage was built from
    virtual ExternalStorageConfig conf() const = 0;

    // Column names of the object's records, empty when the storage does not know them
    virtual std::vector<std::string> column_names() const { return {}; }

    // Sequential read of one object; the stream owns everything it needs
    virtual std::unique_ptr<std::istream> read_file(const std::string& basename) = 0;

    // Read starting at a byte offset; size receives the object size when known
    virtual std::unique_ptr<std::istream> read_file_at(const std::string& basename,
                                                       int64_t offset,
                                                       int64_t* size = nullptr) = 0;

    virtual void write_file(const std::string& basename, std::istream& content) = 0;
    virtual std::vector<std::string> list_files(const std::string& pattern) = 0;
    virtual void remove(const std::string& basename) = 0;
    virtual int64_t size(const std::string& basename) = 0;

    virtual void close() = 0;
};
