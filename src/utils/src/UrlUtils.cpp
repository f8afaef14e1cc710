#include "UrlUtils.hpp"
#include <cctype>
#include <stdexcept>

std::string ParsedUrl::first(const std::string& key) const {
    auto it = query.find(key);
    if (it == query.end() || it->second.empty()) {
        return {};
    }
    return it->second.front();
}

static int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

bool UrlUtils::try_percent_decode(std::string_view str, bool plus_as_space, std::string& out) {
    out.clear();
    out.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        const char ch = str[i];
        if (ch == '%') {
            if (i + 2 >= str.size()) {
                return false;
            }
            const int hi = hex_value(str[i + 1]);
            const int lo = hex_value(str[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (ch == '+' && plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(ch);
        }
    }
    return true;
}

std::string UrlUtils::percent_decode(std::string_view str, bool plus_as_space) {
    std::string out;
    if (!try_percent_decode(str, plus_as_space, out)) {
        throw std::invalid_argument("invalid URL escape in '" + std::string(str) + "'");
    }
    return out;
}

std::string UrlUtils::percent_encode(std::string_view str, bool keep_slash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());

    for (unsigned char ch : str) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || (keep_slash && ch == '/')) {
            out.push_back(static_cast<char>(ch));
        } else {
            out.push_back('%');
            out.push_back(hex[ch >> 4]);
            out.push_back(hex[ch & 0x0F]);
        }
    }
    return out;
}

QueryValues UrlUtils::parse_query(std::string_view query) {
    QueryValues values;
    size_t pos = 0;

    while (pos <= query.size()) {
        size_t end = query.find('&', pos);
        if (end == std::string_view::npos) end = query.size();

        const std::string_view pair = query.substr(pos, end - pos);
        pos = end + 1;
        if (pair.empty()) continue;

        const size_t eq_pos = pair.find('=');
        const std::string_view raw_key = pair.substr(0, eq_pos);
        const std::string_view raw_value = eq_pos == std::string_view::npos
            ? std::string_view{} : pair.substr(eq_pos + 1);

        std::string key;
        std::string value;
        if (!try_percent_decode(raw_key, true, key)) {
            continue;
        }
        // Keep the raw text so the consumer can reject it by name
        if (!try_percent_decode(raw_value, true, value)) {
            value = std::string(raw_value);
        }
        values[key].push_back(std::move(value));
    }
    return values;
}

ParsedUrl UrlUtils::parse(const std::string& url) {
    ParsedUrl parsed;
    std::string_view rest(url);

    // 1. Drop fragment
    const size_t hash_pos = rest.find('#');
    if (hash_pos != std::string_view::npos) {
        rest = rest.substr(0, hash_pos);
    }

    // 2. Scheme and authority
    const size_t protocol_pos = rest.find("://");
    const size_t first_query = rest.find('?');
    if (protocol_pos != std::string_view::npos && protocol_pos < first_query) {
        parsed.scheme = std::string(rest.substr(0, protocol_pos));
        rest = rest.substr(protocol_pos + 3);

        const size_t authority_end = rest.find_first_of("/?");
        parsed.authority = std::string(rest.substr(0, authority_end));
        rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);
    }

    // 3. Path and query
    const size_t query_start = rest.find('?');
    parsed.path = percent_decode(rest.substr(0, query_start), false);
    if (query_start != std::string_view::npos) {
        parsed.query = parse_query(rest.substr(query_start + 1));
    }
    return parsed;
}
