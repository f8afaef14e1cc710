#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

// Query values keyed by name; values of a repeated key keep their order.
using QueryValues = std::map<std::string, std::vector<std::string>>;

struct ParsedUrl {
    std::string scheme;     // Empty when the input carries no "<scheme>://"
    std::string authority;  // host[:port], possibly empty ("workload:///...")
    std::string path;       // Percent-decoded
    QueryValues query;

    bool has(const std::string& key) const {
        return query.find(key) != query.end();
    }

    // First value for key, or empty string when absent
    std::string first(const std::string& key) const;
};

class UrlUtils {
public:
    /**
     * Split a URL into scheme, authority, path and decoded query values.
     * A trailing "#fragment" is discarded.
     * @throws std::invalid_argument If the path holds a malformed %-escape
     */
    static ParsedUrl parse(const std::string& url);

    // Pairs whose key has a malformed escape are skipped; a value with one is kept raw
    static QueryValues parse_query(std::string_view query);

    static std::string percent_decode(std::string_view str, bool plus_as_space);
    static std::string percent_encode(std::string_view str, bool keep_slash);

private:
    static bool try_percent_decode(std::string_view str, bool plus_as_space, std::string& out);
};
