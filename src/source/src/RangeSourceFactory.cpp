#include "RangeSourceFactory.hpp"
#include "CurlRangeFetcher.hpp"
#include "FileRangeFetcher.hpp"
#include "StringUtils.hpp"
#include <cmath>

bool RangeSourceFactory::is_remote(const std::string& location) {
    return StringUtils::istarts_with(location, "http://") || StringUtils::istarts_with(location, "https://");
}

std::unique_ptr<RangeFetcher> RangeSourceFactory::create_fetcher(const std::string& location, int timeout_seconds) {
    if (is_remote(location)) {
        return std::make_unique<CurlRangeFetcher>(location, timeout_seconds);
    }
    return std::make_unique<FileRangeFetcher>(location);
}

RetryPolicy RangeSourceFactory::retry_policy(const RunConfig& config) {
    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    policy.base_delay = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(config.retry_backoff_seconds * 1000.0)));
    return policy;
}

std::unique_ptr<RangeStream> RangeSourceFactory::open(const RunConfig& config, uint64_t start_byte) {
    return std::make_unique<RangeStream>(create_fetcher(config.source_url, config.http_timeout),
                                         start_byte,
                                         config.http_chunk_size,
                                         retry_policy(config));
}

SourceIdentity RangeSourceFactory::probe(const RunConfig& config) {
    return create_fetcher(config.source_url, config.http_timeout)->probe();
}
