#include "Bzip2Decompressor.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include <string>

Bzip2Decompressor::Bzip2Decompressor() : output_(OUTPUT_BUFFER_SIZE) {}

Bzip2Decompressor::~Bzip2Decompressor() {
    end_stream();
}

void Bzip2Decompressor::begin_stream() {
    strm_ = bz_stream{};
    const int ret = BZ2_bzDecompressInit(&strm_, 0, 0);
    if (ret != BZ_OK) {
        throw DecompressError("BZ2_bzDecompressInit failed: " + std::to_string(ret));
    }
    active_ = true;
    stream_consumed_ = 0;
}

void Bzip2Decompressor::end_stream() noexcept {
    if (active_) {
        BZ2_bzDecompressEnd(&strm_);
        active_ = false;
    }
}

void Bzip2Decompressor::feed(std::string_view raw) {
    input_ = raw;
}

bool Bzip2Decompressor::next(DecompressedChunk& out) {
    while (true) {
        if (trailing_) {
            consumed_ += input_.size();
            input_ = {};
            return false;
        }
        if (input_.empty() && !output_pending_) {
            return false;
        }
        if (!active_) {
            if (input_.empty()) {
                return false;
            }
            begin_stream();
        }

        strm_.next_in = const_cast<char*>(input_.data());
        strm_.avail_in = static_cast<unsigned int>(input_.size());
        strm_.next_out = output_.data();
        strm_.avail_out = static_cast<unsigned int>(output_.size());

        const int ret = BZ2_bzDecompress(&strm_);

        const size_t used = input_.size() - strm_.avail_in;
        const size_t produced = output_.size() - strm_.avail_out;
        input_.remove_prefix(used);
        consumed_ += used;
        stream_consumed_ += used;
        output_pending_ = strm_.avail_out == 0;

        if (ret == BZ_STREAM_END) {
            end_stream();
            ++streams_completed_;
            output_pending_ = false;
            out.data = std::string_view(output_.data(), produced);
            out.stream_end = true;
            out.compressed_offset = consumed_;
            return true;
        }

        if (ret == BZ_DATA_ERROR_MAGIC && streams_completed_ > 0 && stream_consumed_ <= 4) {
            // Padding or junk after the last complete stream
            LogUtils::warn("Ignoring non-bzip2 data after stream {} at compressed offset {}",
                           streams_completed_, consumed_ - stream_consumed_);
            end_stream();
            trailing_ = true;
            continue;
        }

        if (ret != BZ_OK) {
            end_stream();
            throw DecompressError("bzip2 stream corrupt at compressed offset " +
                                  std::to_string(consumed_) + " (code " + std::to_string(ret) + ")");
        }

        if (produced > 0) {
            out.data = std::string_view(output_.data(), produced);
            out.stream_end = false;
            out.compressed_offset = consumed_;
            return true;
        }
        if (used == 0) {
            return false;
        }
    }
}

void Bzip2Decompressor::finish() {
    if (active_ && stream_consumed_ > 0) {
        LogUtils::warn("bzip2 input ended inside stream {} after {} bytes; output may be truncated",
                       streams_completed_ + 1, stream_consumed_);
    }
    end_stream();
}
