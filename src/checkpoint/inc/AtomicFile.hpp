#pragma once

#include <string>

// Removes a temporary file on scope exit unless released
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard();

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void release() noexcept { released_ = true; }
    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    bool released_ = false;
};

// Writes content to <path>.tmp then renames it over path. The previous
// file is left untouched on failure. Throws CheckpointError.
void write_file_atomically(const std::string& path, const std::string& content);
