#pragma once
#include "CompressionType.hpp"
#include <cstdint>
#include <memory>
#include <string_view>

struct DecompressedChunk {
    std::string_view data;            // valid until the next call to next()
    bool stream_end = false;          // a compressed stream finished with this chunk
    uint64_t compressed_offset = 0;   // input bytes consumed when the stream finished
};

// Incremental decompressor. Input handed to feed() must stay alive until
// next() has returned false for it.
class BaseDecompressor {
public:
    static constexpr size_t OUTPUT_BUFFER_SIZE = 256 * 1024;

    virtual ~BaseDecompressor() = default;

    virtual void feed(std::string_view raw) = 0;

    // Next piece of output. False once the fed input is fully consumed.
    virtual bool next(DecompressedChunk& out) = 0;

    // No more input will come; reports a stream cut off mid-way
    virtual void finish() = 0;

    // Compressed offsets map 1:1 to decompressed offsets
    virtual bool byte_addressable() const { return false; }

    // Compressed bytes consumed since construction
    uint64_t consumed() const noexcept { return consumed_; }

    uint64_t streams_completed() const noexcept { return streams_completed_; }

protected:
    uint64_t consumed_ = 0;
    uint64_t streams_completed_ = 0;
};

class Decompressor {
public:
    // type must already be resolved; AUTO is rejected
    static std::unique_ptr<BaseDecompressor> create(CompressionType type);
};
