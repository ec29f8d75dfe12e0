#include "Checkpoint.hpp"

namespace {

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optional_from_json(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

void to_json(nlohmann::json& j, const Checkpoint& cp) {
    j = nlohmann::json{
        {"source_url", cp.source_url},
        {"source_etag", optional_to_json(cp.source_etag)},
        {"compressed_bytes_read", cp.compressed_bytes_read},
        {"resume_skip_pages", cp.resume_skip_pages},
        {"pages_processed", cp.pages_processed},
        {"last_page_id", optional_to_json(cp.last_page_id)},
        {"last_page_title", optional_to_json(cp.last_page_title)},
        {"output_file", cp.output_file},
        {"output_bytes_written", cp.output_bytes_written},
        {"last_checkpoint_time", cp.last_checkpoint_time},
        {"checkpoint_version", cp.checkpoint_version},
        {"config_hash", cp.config_hash}
    };
}

void from_json(const nlohmann::json& j, Checkpoint& cp) {
    j.at("source_url").get_to(cp.source_url);
    cp.source_etag = optional_from_json(j, "source_etag");
    j.at("compressed_bytes_read").get_to(cp.compressed_bytes_read);
    cp.resume_skip_pages = j.value("resume_skip_pages", uint64_t{0});
    j.at("pages_processed").get_to(cp.pages_processed);
    cp.last_page_id = optional_from_json(j, "last_page_id");
    cp.last_page_title = optional_from_json(j, "last_page_title");
    j.at("output_file").get_to(cp.output_file);
    j.at("output_bytes_written").get_to(cp.output_bytes_written);
    j.at("last_checkpoint_time").get_to(cp.last_checkpoint_time);
    cp.checkpoint_version = j.value("checkpoint_version", Checkpoint::VERSION);
    j.at("config_hash").get_to(cp.config_hash);
}
