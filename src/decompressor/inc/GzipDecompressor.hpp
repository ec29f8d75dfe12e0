#pragma once
#include "Decompressor.hpp"
#include <zlib.h>
#include <vector>

// gzip/zlib decoder that continues across concatenated gzip members
class GzipDecompressor : public BaseDecompressor {
public:
    GzipDecompressor();
    ~GzipDecompressor() override;

    GzipDecompressor(const GzipDecompressor&) = delete;
    GzipDecompressor& operator=(const GzipDecompressor&) = delete;

    void feed(std::string_view raw) override;
    bool next(DecompressedChunk& out) override;
    void finish() override;

private:
    z_stream zs_{};
    bool trailing_ = false;
    bool output_pending_ = false;
    uint64_t member_consumed_ = 0;
    std::string_view input_;
    std::vector<char> output_;
};
