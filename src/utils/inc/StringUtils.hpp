#pragma once

#include <string>
#include <string_view>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static void trim(std::string& str);

    // Strip every leading and trailing character contained in chars
    static std::string trim_chars(std::string_view str, std::string_view chars);

    // Split on delim; keeps empty pieces, so "a//b" yields {"a", "", "b"}
    static std::vector<std::string> split(std::string_view str, char delim);
    static std::string join(const std::vector<std::string>& parts, const std::string& sep);

    static bool starts_with(std::string_view str, std::string_view prefix);
};
