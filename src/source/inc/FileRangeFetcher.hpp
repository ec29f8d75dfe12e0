#pragma once

#include "RangeFetcher.hpp"
#include <fstream>
#include <string>

// Local file source, addressed by a plain path or a file:// URL.
// Its fingerprint stands in for an ETag: modification time and size.
class FileRangeFetcher : public RangeFetcher {
public:
    explicit FileRangeFetcher(const std::string& location);

    void open(uint64_t start_byte) override;
    bool read(std::string& chunk, size_t max_bytes) override;
    void close() noexcept override;
    SourceIdentity probe() override;
    std::string describe() const override { return path_; }

    const std::string& path() const noexcept { return path_; }

    static std::string path_from_location(const std::string& location);

private:
    std::string path_;
    std::ifstream file_;
};
