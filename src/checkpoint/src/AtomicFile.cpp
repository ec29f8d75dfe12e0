#include "AtomicFile.hpp"
#include "IngestErrors.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TempFileGuard::~TempFileGuard() {
    if (released_) {
        return;
    }
    std::error_code ec;
    if (fs::is_regular_file(path_, ec)) {
        fs::remove(path_, ec);
    }
}

void write_file_atomically(const std::string& path, const std::string& content) {
    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw CheckpointError("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    TempFileGuard guard(path + ".tmp");
    {
        std::ofstream ofs(guard.path(), std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw CheckpointError("Failed to open file for writing: " + guard.path());
        }
        ofs << content;
        ofs.flush();
        if (!ofs) {
            throw CheckpointError("Failed to write " + guard.path());
        }
    }

    fs::rename(guard.path(), target, ec);
    if (ec) {
        throw CheckpointError("Failed to replace " + path + ": " + ec.message());
    }
    guard.release();
}
