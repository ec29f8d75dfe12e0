#pragma once

#include "AppConfig.hpp"
#include "CompressionType.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw ConfigError("Expected a mapping for " + context);
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw ConfigError("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<CompressionType> {
        static bool decode(const Node& node, CompressionType& rhs) {
            try {
                rhs = string_to_compression(node.as<std::string>());
            } catch (const std::invalid_argument& e) {
                throw ConfigError(std::string(e.what()) + " (expected auto, none, gzip or bzip2)");
            }
            return true;
        }
    };

    template<>
    struct convert<LogConfig> {
        static bool decode(const Node& node, LogConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "level", "file", "max_file_size", "max_files"
            };
            check_unknown_keys(node, valid_keys, "log");

            if (node["level"]) {
                rhs.level = node["level"].as<std::string>();
                try {
                    LogUtils::parse_level(rhs.level);
                } catch (const std::invalid_argument& e) {
                    throw ConfigError(std::string(e.what()) + " in log.");
                }
            }
            if (node["file"]) {
                rhs.file = node["file"].as<std::string>();
            }
            if (node["max_file_size"]) {
                rhs.max_file_size = node["max_file_size"].as<size_t>();
                if (rhs.max_file_size == 0) {
                    throw ConfigError("max_file_size must be greater than 0 in log.");
                }
            }
            if (node["max_files"]) {
                rhs.max_files = node["max_files"].as<size_t>();
            }
            return true;
        }
    };

    // Keys are applied on top of whatever `rhs` already holds
    inline void merge_run_config(const Node& node, RunConfig& rhs) {
        if (node["source_url"]) rhs.source_url = node["source_url"].as<std::string>();
        if (node["work_dir"]) rhs.work_dir = node["work_dir"].as<std::string>();
        if (node["output_dir"]) rhs.output_dir = node["output_dir"].as<std::string>();
        if (node["output_filename"]) rhs.output_filename = node["output_filename"].as<std::string>();
        if (node["compression"]) rhs.compression = node["compression"].as<CompressionType>();

        if (node["checkpoint_every_pages"]) rhs.checkpoint_every_pages = node["checkpoint_every_pages"].as<uint64_t>();
        if (node["checkpoint_every_seconds"]) rhs.checkpoint_every_seconds = node["checkpoint_every_seconds"].as<uint64_t>();
        if (node["checkpoint_every_bytes"]) rhs.checkpoint_every_bytes = node["checkpoint_every_bytes"].as<uint64_t>();

        if (node["http_chunk_size"]) rhs.http_chunk_size = node["http_chunk_size"].as<size_t>();
        if (node["http_timeout"]) rhs.http_timeout = node["http_timeout"].as<int>();
        if (node["max_retries"]) rhs.max_retries = node["max_retries"].as<int>();
        if (node["retry_backoff_seconds"]) rhs.retry_backoff_seconds = node["retry_backoff_seconds"].as<double>();

        if (node["skip_redirects"]) rhs.skip_redirects = node["skip_redirects"].as<bool>();
        if (node["skip_disambiguation"]) rhs.skip_disambiguation = node["skip_disambiguation"].as<bool>();
        if (node["allowed_namespaces"]) {
            const auto values = node["allowed_namespaces"].as<std::vector<int>>();
            if (values.empty()) {
                throw ConfigError("allowed_namespaces must list at least one namespace.");
            }
            rhs.allowed_namespaces = std::set<int>(values.begin(), values.end());
        }

        if (node["force_restart"]) rhs.force_restart = node["force_restart"].as<bool>();
        if (node["validate_source_unchanged"]) rhs.validate_source_unchanged = node["validate_source_unchanged"].as<bool>();
        if (node["truncate_uncommitted_output"]) rhs.truncate_uncommitted_output = node["truncate_uncommitted_output"].as<bool>();
    }

    template<>
    struct convert<RunConfig> {
        static bool decode(const Node& node, RunConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "source_url", "work_dir", "output_dir", "output_filename", "compression",
                "checkpoint_every_pages", "checkpoint_every_seconds", "checkpoint_every_bytes",
                "http_chunk_size", "http_timeout", "max_retries", "retry_backoff_seconds",
                "skip_redirects", "skip_disambiguation", "allowed_namespaces",
                "force_restart", "validate_source_unchanged", "truncate_uncommitted_output"
            };
            check_unknown_keys(node, valid_keys, "run configuration");
            merge_run_config(node, rhs);
            return true;
        }
    };

    // Top level of a config file: the run settings plus `verbose` and `log`
    template<>
    struct convert<AppConfig> {
        static bool decode(const Node& node, AppConfig& rhs) {
            if (node.IsNull()) {
                return true;
            }
            Node run_node = Clone(node);
            if (run_node.IsMap() && run_node["log"]) {
                rhs.log = run_node["log"].as<LogConfig>();
                run_node.remove("log");
            }
            if (run_node.IsMap() && run_node["verbose"]) {
                rhs.verbose = run_node["verbose"].as<bool>();
                run_node.remove("verbose");
            }
            if (run_node.IsMap() && run_node.size() == 0) {
                return true;
            }
            convert<RunConfig>::decode(run_node, rhs.run);
            return true;
        }
    };

}
