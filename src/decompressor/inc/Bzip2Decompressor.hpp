#pragma once
#include "Decompressor.hpp"
#include <bzlib.h>
#include <vector>

// Multistream-aware bzip2 decoder: a new stream is started transparently
// after each end-of-stream marker.
class Bzip2Decompressor : public BaseDecompressor {
public:
    Bzip2Decompressor();
    ~Bzip2Decompressor() override;

    Bzip2Decompressor(const Bzip2Decompressor&) = delete;
    Bzip2Decompressor& operator=(const Bzip2Decompressor&) = delete;

    void feed(std::string_view raw) override;
    bool next(DecompressedChunk& out) override;
    void finish() override;

private:
    void begin_stream();
    void end_stream() noexcept;

    bz_stream strm_{};
    bool active_ = false;
    bool trailing_ = false;
    bool output_pending_ = false;
    uint64_t stream_consumed_ = 0;
    std::string_view input_;
    std::vector<char> output_;
};
