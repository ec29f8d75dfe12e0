#include "RunConfig.hpp"
#include "IngestErrors.hpp"
#include <filesystem>

namespace fs = std::filesystem;

std::string RunConfig::resolved_output_dir() const {
    if (!output_dir.empty()) {
        return output_dir;
    }
    return (fs::path(work_dir) / "parsed").string();
}

std::string RunConfig::output_path() const {
    return (fs::path(resolved_output_dir()) / output_filename).string();
}

std::string RunConfig::checkpoint_path() const {
    return (fs::path(work_dir) / "checkpoints" / "stream_parse.checkpoint.json").string();
}

std::string RunConfig::state_path() const {
    return (fs::path(work_dir) / "state" / "stream_parse.state.json").string();
}

void RunConfig::validate() const {
    if (source_url.empty()) {
        throw ConfigError("source_url is required");
    }
    if (work_dir.empty()) {
        throw ConfigError("work_dir must not be empty");
    }
    if (output_filename.empty()) {
        throw ConfigError("output_filename must not be empty");
    }
    if (checkpoint_every_pages < 1) {
        throw ConfigError("checkpoint_every_pages must be >= 1");
    }
    if (checkpoint_every_seconds < 1) {
        throw ConfigError("checkpoint_every_seconds must be >= 1");
    }
    if (checkpoint_every_bytes < 1) {
        throw ConfigError("checkpoint_every_bytes must be >= 1");
    }
    if (http_chunk_size < 1024 || http_chunk_size > MAX_HTTP_CHUNK_SIZE) {
        throw ConfigError("http_chunk_size must be between 1024 and " + std::to_string(MAX_HTTP_CHUNK_SIZE) +
                          ", got " + std::to_string(http_chunk_size));
    }
    if (http_timeout < 1) {
        throw ConfigError("http_timeout must be >= 1 second");
    }
    if (max_retries < 0) {
        throw ConfigError("max_retries must be >= 0");
    }
    if (!(retry_backoff_seconds > 0.0)) {
        throw ConfigError("retry_backoff_seconds must be > 0");
    }
}

void to_json(nlohmann::json& j, const RunConfig& config) {
    j = nlohmann::json{
        {"source_url", config.source_url},
        {"work_dir", config.work_dir},
        {"output_dir", config.resolved_output_dir()},
        {"output_filename", config.output_filename},
        {"compression", compression_to_string(config.compression)},
        {"checkpoint_every_pages", config.checkpoint_every_pages},
        {"checkpoint_every_seconds", config.checkpoint_every_seconds},
        {"checkpoint_every_bytes", config.checkpoint_every_bytes},
        {"http_chunk_size", config.http_chunk_size},
        {"http_timeout", config.http_timeout},
        {"max_retries", config.max_retries},
        {"retry_backoff_seconds", config.retry_backoff_seconds},
        {"skip_redirects", config.skip_redirects},
        {"skip_disambiguation", config.skip_disambiguation},
        {"allowed_namespaces", config.allowed_namespaces},
        {"force_restart", config.force_restart},
        {"validate_source_unchanged", config.validate_source_unchanged},
        {"truncate_uncommitted_output", config.truncate_uncommitted_output}
    };
}

std::string RunConfig::canonical_json() const {
    nlohmann::json j = *this;
    // nlohmann::json objects are key-ordered, so dump() is canonical
    return j.dump();
}
