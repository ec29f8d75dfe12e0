#include "FileRangeFetcher.hpp"
#include "IngestErrors.hpp"
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

FileRangeFetcher::FileRangeFetcher(const std::string& location)
    : path_(path_from_location(location)) {}

std::string FileRangeFetcher::path_from_location(const std::string& location) {
    const std::string scheme = "file://";
    if (location.compare(0, scheme.size(), scheme) == 0) {
        return location.substr(scheme.size());
    }
    return location;
}

void FileRangeFetcher::open(uint64_t start_byte) {
    close();

    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        throw TransportError("Local source not found: " + path_, false, 404);
    }

    file_.open(path_, std::ios::binary);
    if (!file_) {
        throw TransportError("Cannot open local source: " + path_);
    }
    file_.seekg(static_cast<std::streamoff>(start_byte), std::ios::beg);
    if (!file_) {
        throw TransportError("Cannot seek to byte " + std::to_string(start_byte) + " in " + path_);
    }
}

bool FileRangeFetcher::read(std::string& chunk, size_t max_bytes) {
    if (!file_.is_open()) {
        throw TransportError("Read on a closed source: " + path_);
    }

    chunk.resize(max_bytes);
    file_.read(chunk.data(), static_cast<std::streamsize>(max_bytes));
    const auto got = file_.gcount();
    if (file_.bad()) {
        throw TransportError("I/O error reading " + path_, true);
    }
    chunk.resize(static_cast<size_t>(got));
    return got > 0;
}

void FileRangeFetcher::close() noexcept {
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
}

SourceIdentity FileRangeFetcher::probe() {
    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    if (ec) {
        throw TransportError("Cannot stat local source " + path_ + ": " + ec.message(), false, 404);
    }
    const auto mtime = fs::last_write_time(path_, ec);
    if (ec) {
        throw TransportError("Cannot stat local source " + path_ + ": " + ec.message());
    }

    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();

    SourceIdentity identity;
    identity.fingerprint = "file-mtime-" + std::to_string(ns) + "-size-" + std::to_string(size);
    identity.supports_range = true;
    return identity;
}
