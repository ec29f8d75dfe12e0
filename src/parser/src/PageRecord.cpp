#include "PageRecord.hpp"

void to_json(nlohmann::json& j, const PageRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"title", record.title},
        {"text", record.text},
        {"namespace", record.ns},
        {"is_redirect", record.is_redirect}
    };
}

void from_json(const nlohmann::json& j, PageRecord& record) {
    j.at("id").get_to(record.id);
    j.at("title").get_to(record.title);
    j.at("text").get_to(record.text);
    j.at("namespace").get_to(record.ns);
    j.at("is_redirect").get_to(record.is_redirect);
}

std::string PageRecord::to_json_line() const {
    const nlohmann::json j = *this;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
