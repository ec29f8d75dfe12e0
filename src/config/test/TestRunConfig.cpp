#include "RunConfig.hpp"
#include "CompressionType.hpp"
#include "IngestErrors.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

bool rejects(const RunConfig& config) {
    try {
        config.validate();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

RunConfig valid_config() {
    RunConfig config;
    config.source_url = "https://dumps.wikimedia.org/enwiki/latest/enwiki-latest-pages-articles.xml.bz2";
    return config;
}

} // namespace

void test_defaults() {
    RunConfig config;
    assert(config.work_dir == "work");
    assert(config.output_filename == "articles.jsonl");
    assert(config.compression == CompressionType::AUTO);
    assert(config.checkpoint_every_pages == 1000);
    assert(config.checkpoint_every_seconds == 60);
    assert(config.checkpoint_every_bytes == 100ULL * 1024 * 1024);
    assert(config.http_chunk_size == 1024 * 1024);
    assert(config.http_timeout == 300);
    assert(config.max_retries == 5);
    assert(config.retry_backoff_seconds == 10.0);
    assert(config.skip_redirects);
    assert(!config.skip_disambiguation);
    assert(config.allowed_namespaces == std::set<int>{0});
    assert(!config.force_restart);
    assert(config.validate_source_unchanged);
    assert(!config.truncate_uncommitted_output);
    std::cout << "test_defaults passed" << std::endl;
}

void test_paths() {
    RunConfig config;
    config.work_dir = "/data/wiki";
    assert(config.resolved_output_dir() == "/data/wiki/parsed");
    assert(config.output_path() == "/data/wiki/parsed/articles.jsonl");
    assert(config.checkpoint_path() == "/data/wiki/checkpoints/stream_parse.checkpoint.json");
    assert(config.state_path() == "/data/wiki/state/stream_parse.state.json");

    config.output_dir = "/srv/out";
    config.output_filename = "pages.jsonl";
    assert(config.output_path() == "/srv/out/pages.jsonl");
    std::cout << "test_paths passed" << std::endl;
}

void test_validate() {
    RunConfig config = valid_config();
    config.validate();

    assert(rejects(RunConfig{}));

    config = valid_config();
    config.checkpoint_every_pages = 0;
    assert(rejects(config));

    config = valid_config();
    config.checkpoint_every_seconds = 0;
    assert(rejects(config));

    config = valid_config();
    config.http_chunk_size = 1023;
    assert(rejects(config));
    config.http_chunk_size = 1024;
    assert(!rejects(config));
    config.http_chunk_size = RunConfig::MAX_HTTP_CHUNK_SIZE;
    assert(!rejects(config));
    config.http_chunk_size = RunConfig::MAX_HTTP_CHUNK_SIZE + 1;
    assert(rejects(config));
    config.http_chunk_size = size_t{3} * 1024 * 1024 * 1024;
    assert(rejects(config));

    config = valid_config();
    config.max_retries = -1;
    assert(rejects(config));
    config.max_retries = 0;
    assert(!rejects(config));

    config = valid_config();
    config.retry_backoff_seconds = 0.0;
    assert(rejects(config));

    config = valid_config();
    config.http_timeout = 0;
    assert(rejects(config));
    std::cout << "test_validate passed" << std::endl;
}

void test_canonical_json() {
    const RunConfig base = valid_config();
    assert(base.canonical_json() == valid_config().canonical_json());

    const auto json = nlohmann::json::parse(base.canonical_json());
    assert(json["compression"] == "AUTO");
    assert(json["output_dir"] == "work/parsed");
    assert(json["allowed_namespaces"] == nlohmann::json::array({0}));

    RunConfig changed = base;
    changed.skip_disambiguation = true;
    assert(changed.canonical_json() != base.canonical_json());

    changed = base;
    changed.allowed_namespaces = {0, 14};
    assert(changed.canonical_json() != base.canonical_json());

    changed = base;
    changed.force_restart = true;
    assert(changed.canonical_json() != base.canonical_json());
    std::cout << "test_canonical_json passed" << std::endl;
}

void test_compression_names() {
    assert(string_to_compression("bzip2") == CompressionType::BZIP2);
    assert(string_to_compression("BZ2") == CompressionType::BZIP2);
    assert(string_to_compression("gzip") == CompressionType::GZIP);
    assert(string_to_compression("gz") == CompressionType::GZIP);
    assert(string_to_compression("none") == CompressionType::NONE);
    assert(string_to_compression("Auto") == CompressionType::AUTO);
    assert(std::string(compression_to_string(CompressionType::BZIP2)) == "BZIP2");

    bool thrown = false;
    try {
        string_to_compression("xz");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_compression_names passed" << std::endl;
}

void test_resolve_compression() {
    assert(resolve_compression(CompressionType::AUTO, "https://host/enwiki.xml.bz2") == CompressionType::BZIP2);
    assert(resolve_compression(CompressionType::AUTO, "https://host/enwiki.XML.BZ2?x=1") == CompressionType::BZIP2);
    assert(resolve_compression(CompressionType::AUTO, "/tmp/simplewiki.xml.gz") == CompressionType::GZIP);
    assert(resolve_compression(CompressionType::AUTO, "/tmp/simplewiki.xml") == CompressionType::NONE);
    assert(resolve_compression(CompressionType::GZIP, "/tmp/simplewiki.xml.bz2") == CompressionType::GZIP);
    std::cout << "test_resolve_compression passed" << std::endl;
}

int main() {
    test_defaults();
    test_paths();
    test_validate();
    test_canonical_json();
    test_compression_names();
    test_resolve_compression();

    std::cout << "All RunConfig tests passed!" << std::endl;
    return 0;
}
