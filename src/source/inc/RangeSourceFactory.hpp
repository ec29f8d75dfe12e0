#pragma once

#include "RangeFetcher.hpp"
#include "RangeStream.hpp"
#include "RunConfig.hpp"
#include <memory>
#include <string>

class RangeSourceFactory {
public:
    // http(s):// goes through curl, anything else is a local path
    static std::unique_ptr<RangeFetcher> create_fetcher(const std::string& location, int timeout_seconds);

    static bool is_remote(const std::string& location);

    static RetryPolicy retry_policy(const RunConfig& config);

    static std::unique_ptr<RangeStream> open(const RunConfig& config, uint64_t start_byte);

    static SourceIdentity probe(const RunConfig& config);
};
