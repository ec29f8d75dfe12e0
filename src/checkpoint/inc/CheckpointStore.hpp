#pragma once

#include "Checkpoint.hpp"
#include "RangeFetcher.hpp"
#include "RunConfig.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Durable resume state for one run configuration.
class CheckpointStore {
public:
    using Clock = std::chrono::steady_clock;
    using Probe = std::function<SourceIdentity()>;

    explicit CheckpointStore(const RunConfig& config);
    CheckpointStore(std::string path, const RunConfig& config);

    // Empty when the file is missing or cannot be parsed
    std::optional<Checkpoint> load() const;

    // Stamps the config hash and replaces the file atomically.
    // Throws CheckpointError; the previous file survives a failure.
    void save(Checkpoint& checkpoint) const;

    bool is_valid(const Checkpoint& checkpoint, const Probe& probe) const;

    // Counters are cumulative totals, compared against the last mark
    bool should_checkpoint(uint64_t pages, uint64_t bytes, Clock::time_point now) const;
    void mark_checkpointed(uint64_t pages, uint64_t bytes, Clock::time_point now);

    const std::string& path() const noexcept { return path_; }
    const std::string& config_hash() const noexcept { return config_hash_; }

    static std::string compute_config_hash(const RunConfig& config);

private:
    std::string path_;
    RunConfig config_;
    std::string config_hash_;

    uint64_t last_pages_ = 0;
    uint64_t last_bytes_ = 0;
    Clock::time_point last_time_;
};
