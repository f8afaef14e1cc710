#pragma once

#include "WorkloadConfig.hpp"
#include "UrlUtils.hpp"
#include <string>

/**
 * Turns "<scheme>:///<format>/<generator>/<table>?version=<v>[&row-start=<n>]
 * [&row-end=<m>][&<flag>=<value>...]" into a WorkloadConfig.
 *
 * Every failure is a StorageError with one of MalformedPath, MissingVersion,
 * BadRowBound or UnsupportedFormat. The generator registry is never consulted.
 */
class WorkloadConfigParser {
public:
    static constexpr const char* version_key = "version";
    static constexpr const char* row_start_key = "row-start";
    static constexpr const char* row_end_key = "row-end";

    static WorkloadConfig parse(const std::string& uri);
    static WorkloadConfig parse(const ParsedUrl& url);

private:
    static int64_t parse_row_bound(const std::string& key, const std::string& value);
};
