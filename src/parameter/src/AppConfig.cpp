#include "AppConfig.hpp"
#include <filesystem>

std::string AppConfig::log_path() const {
    if (!log.file.empty()) {
        return log.file;
    }
    return (std::filesystem::path(run.work_dir) / "log" / "wikistream.log").string();
}
