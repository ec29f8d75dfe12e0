#include "ParameterContext.hpp"
#include "IngestErrors.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--source-url", 's', "Dump URL or local file to ingest", true},
    {"--work-dir", 'w', "Directory for output, checkpoints, state and logs", true},
    {"--checkpoint-pages", 'p', "Checkpoint after this many records", true},
    {"--force-restart", 'f', "Ignore any checkpoint and start from the beginning", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: wikistream [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  WIKISTREAM_SOURCE_URL    Same as --source-url\n"
              << "  WIKISTREAM_WORK_DIR      Same as --work-dir\n"
              << "\nExamples:\n"
              << "  wikistream --config-file=conf/wikistream.yaml\n"
              << "  wikistream -s https://dumps.wikimedia.org/simplewiki/latest/"
                 "simplewiki-latest-pages-articles-multistream.xml.bz2 -w ./work\n\n";
}

void ParameterContext::show_version() {
    std::cout << "wikistream version: " << WIKISTREAM_VERSION << std::endl;
    std::cout << "git: " << WIKISTREAM_BUILD_GIT << std::endl;
    std::cout << "build: " << WIKISTREAM_BUILD_TARGET_OSTYPE << "-" << WIKISTREAM_BUILD_TARGET_CPUTYPE
              << " " << WIKISTREAM_BUILD_DATE << std::endl;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    AppConfig merged = config_;
    YAML::convert<AppConfig>::decode(config, merged);
    config_ = merged;
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
        config_.config_file = file_path;
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw ConfigError("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw ConfigError("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw ConfigError("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (!arg.empty() && arg[0] == '-') {
            if (arg.length() != 2) {
                throw ConfigError("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw ConfigError("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw ConfigError("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw ConfigError("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& run = config_.run;
    if (cli_params.count("--source-url"))
        run.source_url = cli_params["--source-url"];

    if (cli_params.count("--work-dir"))
        run.work_dir = cli_params["--work-dir"];

    if (cli_params.count("--checkpoint-pages")) {
        const std::string& text = cli_params["--checkpoint-pages"];
        size_t used = 0;
        unsigned long long pages = 0;
        try {
            pages = std::stoull(text, &used);
        } catch (const std::exception&) {
            throw ConfigError("Invalid page count for --checkpoint-pages: " + text);
        }
        if (used != text.size() || text[0] == '-') {
            throw ConfigError("Invalid page count for --checkpoint-pages: " + text);
        }
        run.checkpoint_every_pages = pages;
    }

    if (cli_params.count("--force-restart")) {
        run.force_restart = true;
    }

    if (cli_params.count("--verbose")) {
        config_.verbose = true;
    }
}

void ParameterContext::merge_environment_vars() {
    const std::vector<std::pair<std::string, std::string*>> env_mappings = {
        {"WIKISTREAM_SOURCE_URL", &config_.run.source_url},
        {"WIKISTREAM_WORK_DIR", &config_.run.work_dir}
    };

    for (const auto& [env_var, target] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && env_value[0] != '\0') {
            *target = env_value;
        }
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();

    config_.run.validate();
    return true;
}

const AppConfig& ParameterContext::get_config() const {
    return config_;
}

const RunConfig& ParameterContext::get_run_config() const {
    return config_.run;
}
