#include "WorkloadConfigParser.hpp"
#include "StorageError.hpp"
#include "StringUtils.hpp"
#include "LogUtils.hpp"
#include <charconv>
#include <stdexcept>

WorkloadConfig WorkloadConfigParser::parse(const std::string& uri) {
    ParsedUrl url;
    try {
        url = UrlUtils::parse(uri);
    } catch (const std::invalid_argument& e) {
        throw StorageError(StorageErrorCode::MalformedPath,
                           "path must be of the form /<format>/<generator>/<table>: " + std::string(e.what()));
    }
    return parse(url);
}

WorkloadConfig WorkloadConfigParser::parse(const ParsedUrl& url) {
    WorkloadConfig config;

    // 1. Path: exactly three non-empty segments
    const auto parts = StringUtils::split(StringUtils::trim_chars(url.path, "/"), '/');
    bool shape_ok = parts.size() == 3;
    for (const auto& part : parts) {
        if (part.empty()) shape_ok = false;
    }
    if (!shape_ok) {
        throw StorageError(StorageErrorCode::MalformedPath,
                           "path must be of the form /<format>/<generator>/<table>: " + url.path);
    }
    config.format_name = parts[0];
    config.generator = parts[1];
    config.table = parts[2];

    // 2. Version is mandatory and copied verbatim
    QueryValues query = url.query;
    if (query.find(version_key) == query.end()) {
        throw StorageError(StorageErrorCode::MissingVersion, "parameter version is required");
    }
    config.version = url.first(version_key);
    query.erase(version_key);

    // 3. Row bounds
    if (auto it = query.find(row_start_key); it != query.end()) {
        config.row_begin = parse_row_bound(row_start_key, it->second.empty() ? std::string() : it->second.front());
        query.erase(it);
    }
    if (auto it = query.find(row_end_key); it != query.end()) {
        config.row_end = parse_row_bound(row_end_key, it->second.empty() ? std::string() : it->second.front());
        query.erase(it);
    }
    if (config.row_end != 0 && config.row_end < config.row_begin) {
        throw StorageError(StorageErrorCode::BadRowBound,
                           "row-end " + std::to_string(config.row_end) +
                           " is before row-start " + std::to_string(config.row_begin));
    }

    // 4. Everything else is a generator flag
    for (const auto& [key, values] : query) {
        for (const auto& value : values) {
            config.flags.push_back("--" + key + "=" + value);
        }
    }

    // 5. Format is checked last so query problems are reported first
    config.format = string_to_data_format(config.format_name);

    LogUtils::debug("Parsed workload config: {}", config.describe());
    return config;
}

int64_t WorkloadConfigParser::parse_row_bound(const std::string& key, const std::string& value) {
    if (value.empty()) {
        throw StorageError(StorageErrorCode::BadRowBound,
                           "invalid " + key + " '': expected a base-10 64-bit integer");
    }

    int64_t result = 0;
    const char* first = value.data();
    if (value.size() > 1 && value[0] == '+') {
        ++first;
    }
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, result, 10);

    if (ec != std::errc() || ptr != last) {
        throw StorageError(StorageErrorCode::BadRowBound,
                           "invalid " + key + " '" + value + "': expected a base-10 64-bit integer");
    }
    if (result < 0) {
        throw StorageError(StorageErrorCode::BadRowBound,
                           "invalid " + key + " '" + value + "': must not be negative");
    }
    return result;
}
