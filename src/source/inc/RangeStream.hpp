#pragma once

#include "RangeFetcher.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

struct RetryPolicy {
    int max_retries = 5;
    std::chrono::milliseconds base_delay{10000};

    // base_delay * 2^(attempt-1), attempt counted from 1
    std::chrono::milliseconds delay_for(int attempt) const;
};

// Lazy sequence of raw byte chunks starting at an absolute offset.
// Transient failures reconnect at the first byte not yet yielded, so a
// retried transfer never repeats or drops data.
class RangeStream {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RangeStream(std::unique_ptr<RangeFetcher> fetcher,
                uint64_t start_byte,
                size_t chunk_size,
                RetryPolicy policy,
                Sleeper sleeper = nullptr);
    ~RangeStream();

    RangeStream(const RangeStream&) = delete;
    RangeStream& operator=(const RangeStream&) = delete;

    // Next non-empty chunk; false once the source is exhausted
    bool next(std::string& chunk);

    uint64_t start_byte() const noexcept { return start_byte_; }
    uint64_t position() const noexcept { return position_; }
    int connection_attempts() const noexcept { return connection_attempts_; }
    int retries() const noexcept { return total_retries_; }

private:
    std::unique_ptr<RangeFetcher> fetcher_;
    uint64_t start_byte_;
    uint64_t position_;
    size_t chunk_size_;
    RetryPolicy policy_;
    Sleeper sleeper_;

    bool connected_ = false;
    bool finished_ = false;
    int consecutive_failures_ = 0;
    int connection_attempts_ = 0;
    int total_retries_ = 0;
};
