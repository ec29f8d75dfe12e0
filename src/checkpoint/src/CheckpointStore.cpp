#include "CheckpointStore.hpp"
#include "AtomicFile.hpp"
#include "HashUtils.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include <exception>
#include <filesystem>
#include <fstream>

CheckpointStore::CheckpointStore(const RunConfig& config)
    : CheckpointStore(config.checkpoint_path(), config) {}

CheckpointStore::CheckpointStore(std::string path, const RunConfig& config)
    : path_(std::move(path)),
      config_(config),
      config_hash_(compute_config_hash(config)),
      last_time_(Clock::now()) {}

std::string CheckpointStore::compute_config_hash(const RunConfig& config) {
    return HashUtils::sha256_hex(config.canonical_json()).substr(0, 16);
}

std::optional<Checkpoint> CheckpointStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream ifs(path_);
    if (!ifs) {
        LogUtils::warn("Cannot open checkpoint {}; starting fresh", path_);
        return std::nullopt;
    }

    try {
        nlohmann::json json_data;
        ifs >> json_data;
        auto checkpoint = json_data.get<Checkpoint>();
        LogUtils::debug("Loaded checkpoint {}: {} pages, offset {}", path_,
                        checkpoint.pages_processed, checkpoint.compressed_bytes_read);
        return checkpoint;
    } catch (const nlohmann::json::exception& e) {
        LogUtils::warn("Ignoring corrupt checkpoint {}: {}", path_, e.what());
        return std::nullopt;
    }
}

void CheckpointStore::save(Checkpoint& checkpoint) const {
    checkpoint.config_hash = config_hash_;
    checkpoint.checkpoint_version = Checkpoint::VERSION;

    const nlohmann::json json_data = checkpoint;
    write_file_atomically(path_, json_data.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");

    LogUtils::debug("Checkpoint saved: {} pages, {} output bytes, resume at {} (+{} pages)",
                    checkpoint.pages_processed, checkpoint.output_bytes_written,
                    checkpoint.compressed_bytes_read, checkpoint.resume_skip_pages);
}

bool CheckpointStore::is_valid(const Checkpoint& checkpoint, const Probe& probe) const {
    if (checkpoint.checkpoint_version != Checkpoint::VERSION) {
        LogUtils::info("Checkpoint version {} is not supported", checkpoint.checkpoint_version);
        return false;
    }
    if (checkpoint.config_hash != config_hash_) {
        LogUtils::info("Configuration changed since the checkpoint ({} != {})", checkpoint.config_hash, config_hash_);
        return false;
    }

    if (!config_.validate_source_unchanged || !checkpoint.source_etag) {
        return true;
    }

    try {
        const SourceIdentity identity = probe();
        if (!identity.fingerprint) {
            LogUtils::info("Source no longer reports a fingerprint; checkpoint cannot be trusted");
            return false;
        }
        if (*identity.fingerprint != *checkpoint.source_etag) {
            LogUtils::info("Source changed since the checkpoint ({} != {})",
                           *identity.fingerprint, *checkpoint.source_etag);
            return false;
        }
    } catch (const std::exception& e) {
        LogUtils::warn("Source validation failed: {}", e.what());
        return false;
    }
    return true;
}

bool CheckpointStore::should_checkpoint(uint64_t pages, uint64_t bytes, Clock::time_point now) const {
    if (pages >= last_pages_ + config_.checkpoint_every_pages) {
        return true;
    }
    if (bytes >= last_bytes_ + config_.checkpoint_every_bytes) {
        return true;
    }
    return now - last_time_ >= std::chrono::seconds(config_.checkpoint_every_seconds);
}

void CheckpointStore::mark_checkpointed(uint64_t pages, uint64_t bytes, Clock::time_point now) {
    last_pages_ = pages;
    last_bytes_ = bytes;
    last_time_ = now;
}
