#include "WorkloadConfig.hpp"
#include "UrlUtils.hpp"
#include <fmt/format.h>

std::string WorkloadConfig::to_uri(const std::string& scheme) const {
    std::string uri = scheme + ":///"
        + UrlUtils::percent_encode(format_name, false) + "/"
        + UrlUtils::percent_encode(generator, false) + "/"
        + UrlUtils::percent_encode(table, false)
        + "?version=" + UrlUtils::percent_encode(version, false);

    if (row_begin != 0) {
        uri += "&row-start=" + std::to_string(row_begin);
    }
    if (row_end != 0) {
        uri += "&row-end=" + std::to_string(row_end);
    }

    for (const auto& flag : flags) {
        std::string body = flag.compare(0, 2, "--") == 0 ? flag.substr(2) : flag;
        const size_t eq_pos = body.find('=');
        const std::string key = body.substr(0, eq_pos);
        const std::string value = eq_pos == std::string::npos ? std::string{} : body.substr(eq_pos + 1);
        uri += "&" + UrlUtils::percent_encode(key, false) + "=" + UrlUtils::percent_encode(value, false);
    }
    return uri;
}

std::string WorkloadConfig::describe() const {
    if (row_end_unbounded()) {
        return fmt::format("{}.{}@{} rows [{}, end)", generator, table, version, row_begin);
    }
    return fmt::format("{}.{}@{} rows [{}, {})", generator, table, version, row_begin, row_end);
}

bool WorkloadConfig::operator==(const WorkloadConfig& other) const {
    return format == other.format
        && format_name == other.format_name
        && generator == other.generator
        && version == other.version
        && table == other.table
        && row_begin == other.row_begin
        && row_end == other.row_end
        && flags == other.flags;
}
