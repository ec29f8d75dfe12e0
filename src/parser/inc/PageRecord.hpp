#pragma once

#include <string>
#include <nlohmann/json.hpp>

struct PageRecord {
    std::string id;
    std::string title;
    std::string text;
    int ns = 0;
    bool is_redirect = false;

    // One JSON object without a trailing newline. Invalid UTF-8 is
    // replaced rather than rejected.
    std::string to_json_line() const;
};

void to_json(nlohmann::json& j, const PageRecord& record);
void from_json(const nlohmann::json& j, PageRecord& record);
