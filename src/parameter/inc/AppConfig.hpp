#pragma once

#include "RunConfig.hpp"
#include <cstddef>
#include <string>

struct LogConfig {
    std::string level = "info";
    std::string file;                        // empty: <work_dir>/log/wikistream.log
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

// Everything the command line tool needs; only `run` affects the output.
struct AppConfig {
    RunConfig run;
    LogConfig log;
    bool verbose = false;
    std::string config_file;

    std::string log_path() const;
};
