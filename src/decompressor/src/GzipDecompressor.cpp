#include "GzipDecompressor.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include <string>

GzipDecompressor::GzipDecompressor() : output_(OUTPUT_BUFFER_SIZE) {
    // 15 | 32: largest window, auto-detect gzip or zlib header
    if (inflateInit2(&zs_, 15 | 32) != Z_OK) {
        throw DecompressError("inflateInit2 failed");
    }
}

GzipDecompressor::~GzipDecompressor() {
    inflateEnd(&zs_);
}

void GzipDecompressor::feed(std::string_view raw) {
    input_ = raw;
}

bool GzipDecompressor::next(DecompressedChunk& out) {
    while (true) {
        if (trailing_) {
            consumed_ += input_.size();
            input_ = {};
            return false;
        }
        if (input_.empty() && !output_pending_) {
            return false;
        }

        zs_.next_in = (Bytef*)input_.data();
        zs_.avail_in = static_cast<uInt>(input_.size());
        zs_.next_out = (Bytef*)output_.data();
        zs_.avail_out = static_cast<uInt>(output_.size());

        const int ret = inflate(&zs_, Z_NO_FLUSH);

        const size_t used = input_.size() - zs_.avail_in;
        const size_t produced = output_.size() - zs_.avail_out;
        input_.remove_prefix(used);
        consumed_ += used;
        member_consumed_ += used;
        output_pending_ = zs_.avail_out == 0;

        if (ret == Z_STREAM_END) {
            ++streams_completed_;
            member_consumed_ = 0;
            output_pending_ = false;
            if (inflateReset(&zs_) != Z_OK) {
                throw DecompressError("inflateReset failed");
            }
            out.data = std::string_view(output_.data(), produced);
            out.stream_end = true;
            out.compressed_offset = consumed_;
            return true;
        }

        if (ret == Z_DATA_ERROR && streams_completed_ > 0 && member_consumed_ <= 16) {
            LogUtils::warn("Ignoring non-gzip data after member {} at compressed offset {}",
                           streams_completed_, consumed_ - member_consumed_);
            trailing_ = true;
            continue;
        }

        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw DecompressError("gzip stream corrupt at compressed offset " + std::to_string(consumed_) +
                                  ": " + (zs_.msg ? zs_.msg : std::to_string(ret)));
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

void GzipDecompressor::finish() {
    if (member_consumed_ > 0 && !trailing_) {
        LogUtils::warn("gzip input ended inside member {} after {} bytes; output may be truncated",
                       streams_completed_ + 1, member_consumed_);
    }
}
