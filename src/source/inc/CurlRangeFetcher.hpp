#pragma once

#include "RangeFetcher.hpp"
#include <curl/curl.h>
#include <exception>
#include <string>

// HTTP(S) fetcher driven through the curl multi interface so the body
// is pulled chunk by chunk instead of pushed through callbacks.
class CurlRangeFetcher : public RangeFetcher {
public:
    CurlRangeFetcher(std::string url, int timeout_seconds);
    ~CurlRangeFetcher() override;

    CurlRangeFetcher(const CurlRangeFetcher&) = delete;
    CurlRangeFetcher& operator=(const CurlRangeFetcher&) = delete;

    void open(uint64_t start_byte) override;
    bool read(std::string& chunk, size_t max_bytes) override;
    void close() noexcept override;
    SourceIdentity probe() override;
    std::string describe() const override { return url_; }

    // Whether a failed HTTP status is worth retrying
    static bool is_retryable_status(long status);

    // Whether a curl failure other than an HTTP status is worth retrying
    static bool is_retryable_code(CURLcode code);

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);

    void apply_common_options(CURL* easy) const;
    void drain_messages();
    [[noreturn]] void raise_failure(CURLcode code);

    std::string url_;
    int timeout_seconds_;

    CURL* easy_ = nullptr;
    CURLM* multi_ = nullptr;
    std::string buffer_;
    size_t high_water_ = 0;
    uint64_t start_byte_ = 0;
    bool status_checked_ = false;
    bool paused_ = false;
    bool done_ = false;
    std::exception_ptr pending_error_;
    char error_buffer_[CURL_ERROR_SIZE] = {};
};
