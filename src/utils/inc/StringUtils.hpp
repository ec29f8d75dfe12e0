#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>
#include <cstdint>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static void trim(std::string& str);

    // Returns str without its leading whitespace
    static std::string_view ltrim_view(std::string_view str);

    static bool istarts_with(std::string_view str, std::string_view prefix);
    static bool ends_with(std::string_view str, std::string_view suffix);

    static std::string human_bytes(uint64_t bytes);
};
