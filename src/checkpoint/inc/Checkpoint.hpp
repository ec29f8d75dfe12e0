#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct Checkpoint {
    static constexpr int VERSION = 1;

    std::string source_url;
    std::optional<std::string> source_etag;
    uint64_t compressed_bytes_read = 0;
    uint64_t resume_skip_pages = 0;
    uint64_t pages_processed = 0;
    std::optional<std::string> last_page_id;
    std::optional<std::string> last_page_title;
    std::string output_file;
    uint64_t output_bytes_written = 0;
    std::string last_checkpoint_time;
    int checkpoint_version = VERSION;
    std::string config_hash;
};

void to_json(nlohmann::json& j, const Checkpoint& cp);
void from_json(const nlohmann::json& j, Checkpoint& cp);
