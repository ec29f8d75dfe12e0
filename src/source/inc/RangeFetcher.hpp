#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct SourceIdentity {
    std::optional<std::string> fingerprint;   // ETag or a local surrogate
    bool supports_range = false;
};

// One transfer attempt against a source. Implementations throw
// TransportError; retry decisions belong to RangeStream.
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    // Starts a transfer at start_byte, discarding any previous one
    virtual void open(uint64_t start_byte) = 0;

    // Reads at most max_bytes into chunk. Returns false at end of data.
    virtual bool read(std::string& chunk, size_t max_bytes) = 0;

    virtual void close() noexcept = 0;

    // Header-only identity request; never transfers the body
    virtual SourceIdentity probe() = 0;

    virtual std::string describe() const = 0;
};
