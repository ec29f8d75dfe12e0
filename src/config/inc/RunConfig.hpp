#pragma once

#include "CompressionType.hpp"
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

// Immutable configuration of one ingest run.
struct RunConfig {
    // Chunks reach the XML parser whole, whose length argument is an int
    static constexpr size_t MAX_HTTP_CHUNK_SIZE = 64 * 1024 * 1024;

    std::string source_url;
    std::string work_dir = "work";
    std::string output_dir;                       // empty: <work_dir>/parsed
    std::string output_filename = "articles.jsonl";
    CompressionType compression = CompressionType::AUTO;

    // Checkpointing
    uint64_t checkpoint_every_pages = 1000;
    uint64_t checkpoint_every_seconds = 60;
    uint64_t checkpoint_every_bytes = 104857600;  // 100 MiB

    // HTTP streaming
    size_t http_chunk_size = 1048576;
    int http_timeout = 300;                       // seconds

    // Retry behavior
    int max_retries = 5;
    double retry_backoff_seconds = 10.0;

    // Parsing
    bool skip_redirects = true;
    bool skip_disambiguation = false;
    std::set<int> allowed_namespaces{0};

    // Resume behavior
    bool force_restart = false;
    bool validate_source_unchanged = true;
    bool truncate_uncommitted_output = false;

    std::string resolved_output_dir() const;
    std::string output_path() const;
    std::string checkpoint_path() const;
    std::string state_path() const;

    // Throws ConfigError on out-of-range values
    void validate() const;

    // Key-sorted JSON of every field; the basis of the config hash
    std::string canonical_json() const;
};

void to_json(nlohmann::json& j, const RunConfig& config);
