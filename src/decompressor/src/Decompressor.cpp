#include "Decompressor.hpp"
#include "Bzip2Decompressor.hpp"
#include "GzipDecompressor.hpp"
#include "IngestErrors.hpp"

class PassThroughDecompressor : public BaseDecompressor {
public:
    void feed(std::string_view raw) override { input_ = raw; }

    bool next(DecompressedChunk& out) override {
        if (input_.empty()) {
            return false;
        }
        consumed_ += input_.size();
        out.data = input_;
        out.stream_end = false;
        out.compressed_offset = consumed_;
        input_ = {};
        return true;
    }

    void finish() override {}

    bool byte_addressable() const override { return true; }

private:
    std::string_view input_;
};

std::unique_ptr<BaseDecompressor> Decompressor::create(CompressionType type) {
    switch (type) {
        case CompressionType::NONE:  return std::make_unique<PassThroughDecompressor>();
        case CompressionType::GZIP:  return std::make_unique<GzipDecompressor>();
        case CompressionType::BZIP2: return std::make_unique<Bzip2Decompressor>();
        default: throw ConfigError(std::string("Unresolved compression type: ") + compression_to_string(type));
    }
}
