#pragma once

#include "AppConfig.hpp"
#include "ConfigParser.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when the process should exit without ingesting
    // (help or version was printed)
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    const AppConfig& get_config() const;
    const RunConfig& get_run_config() const;

private:
    AppConfig config_;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--work-dir")
        char short_opt;          // Short option (e.g. 'w')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
