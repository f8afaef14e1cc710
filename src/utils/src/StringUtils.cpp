#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <string>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

std::string StringUtils::to_upper(const std::string& str) {
    std::string upper_str = str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

std::string StringUtils::trim_chars(std::string_view str, std::string_view chars) {
    const size_t first = str.find_first_not_of(chars);
    if (first == std::string_view::npos) {
        return {};
    }
    const size_t last = str.find_last_not_of(chars);
    return std::string(str.substr(first, last - first + 1));
}

std::vector<std::string> StringUtils::split(std::string_view str, char delim) {
    std::vector<std::string> parts;
    size_t pos = 0;

    while (true) {
        const size_t end = str.find(delim, pos);
        if (end == std::string_view::npos) {
            parts.emplace_back(str.substr(pos));
            break;
        }
        parts.emplace_back(str.substr(pos, end - pos));
        pos = end + 1;
    }
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

bool StringUtils::starts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}
