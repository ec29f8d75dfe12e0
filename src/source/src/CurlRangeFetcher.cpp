#include "CurlRangeFetcher.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <memory>
#include <mutex>

namespace {

constexpr const char* USER_AGENT = "wikistream/" WIKISTREAM_VERSION;

void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw TransportError("curl_global_init failed");
        }
    });
}

struct ProbeHeaders {
    long status = 0;
    std::string etag;
    std::string accept_ranges;
};

} // namespace

CurlRangeFetcher::CurlRangeFetcher(std::string url, int timeout_seconds)
    : url_(std::move(url)), timeout_seconds_(timeout_seconds) {
    global_init_once();
}

CurlRangeFetcher::~CurlRangeFetcher() {
    close();
}

bool CurlRangeFetcher::is_retryable_status(long status) {
    if (status == 408 || status == 429) {
        return true;
    }
    return status >= 500;
}

bool CurlRangeFetcher::is_retryable_code(CURLcode code) {
    switch (code) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_NOT_BUILT_IN:
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_FILESIZE_EXCEEDED:
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_OUT_OF_MEMORY:
            return false;
        default:
            return true;
    }
}

void CurlRangeFetcher::apply_common_options(CURL* easy) const {
    curl_easy_setopt(easy, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_seconds_));
    // A stalled transfer counts as a timeout; the body itself may take hours
    curl_easy_setopt(easy, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(easy, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
}

void CurlRangeFetcher::open(uint64_t start_byte) {
    close();

    start_byte_ = start_byte;
    buffer_.clear();
    status_checked_ = false;
    paused_ = false;
    done_ = false;
    pending_error_ = nullptr;
    error_buffer_[0] = '\0';

    easy_ = curl_easy_init();
    multi_ = curl_multi_init();
    if (!easy_ || !multi_) {
        close();
        throw TransportError("Failed to create curl handles for " + url_);
    }

    apply_common_options(easy_);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, error_buffer_);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlRangeFetcher::write_callback);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    if (start_byte_ > 0) {
        const std::string range = std::to_string(start_byte_) + "-";
        curl_easy_setopt(easy_, CURLOPT_RANGE, range.c_str());
    }

    const CURLMcode mc = curl_multi_add_handle(multi_, easy_);
    if (mc != CURLM_OK) {
        close();
        throw TransportError(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc));
    }

    LogUtils::debug("Opened {} at byte {}", url_, start_byte_);
}

size_t CurlRangeFetcher::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlRangeFetcher*>(userdata);
    const size_t total = size * nmemb;

    if (!self->status_checked_) {
        long status = 0;
        curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &status);
        self->status_checked_ = true;
        if (self->start_byte_ > 0 && status != 206) {
            self->pending_error_ = std::make_exception_ptr(TransportError(
                "Server ignored range request for " + self->url_ + " (HTTP " +
                std::to_string(status) + ")", false, status));
            return 0;
        }
    }

    if (self->buffer_.size() >= self->high_water_) {
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    self->buffer_.append(ptr, total);
    return total;
}

void CurlRangeFetcher::raise_failure(CURLcode code) {
    if (pending_error_) {
        std::rethrow_exception(pending_error_);
    }

    const std::string detail = error_buffer_[0] != '\0' ? std::string(error_buffer_)
                                                        : std::string(curl_easy_strerror(code));
    if (code == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
        throw TransportError("HTTP " + std::to_string(status) + " from " + url_,
                             is_retryable_status(status), status);
    }
    throw TransportError(detail + " (" + url_ + ")", is_retryable_code(code));
}

void CurlRangeFetcher::drain_messages() {
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
        if (msg->msg != CURLMSG_DONE) {
            continue;
        }
        const CURLcode code = msg->data.result;
        if (code != CURLE_OK) {
            raise_failure(code);
        }
        done_ = true;
    }
}

bool CurlRangeFetcher::read(std::string& chunk, size_t max_bytes) {
    if (!easy_) {
        throw TransportError("Read on a closed transfer: " + url_);
    }
    high_water_ = max_bytes;

    while (true) {
        if (buffer_.size() >= max_bytes || (done_ && !buffer_.empty())) {
            const size_t n = std::min(max_bytes, buffer_.size());
            chunk.assign(buffer_, 0, n);
            buffer_.erase(0, n);
            if (paused_) {
                paused_ = false;
                curl_easy_pause(easy_, CURLPAUSE_CONT);
            }
            return true;
        }
        if (done_) {
            return false;
        }

        int still_running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &still_running);
        if (mc != CURLM_OK) {
            throw TransportError(std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc), true);
        }
        drain_messages();

        if (buffer_.size() >= max_bytes || done_ || paused_) {
            continue;
        }
        if (still_running) {
            mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
            if (mc != CURLM_OK) {
                throw TransportError(std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc), true);
            }
        }
    }
}

void CurlRangeFetcher::close() noexcept {
    if (multi_ && easy_) {
        curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_) {
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
    }
    if (multi_) {
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
    }
    buffer_.clear();
    paused_ = false;
}

size_t CurlRangeFetcher::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<ProbeHeaders*>(userdata);
    const size_t total = size * nitems;
    const std::string line(buffer, total);

    // A new status line starts the headers of a redirect target
    if (StringUtils::istarts_with(line, "HTTP/")) {
        headers->etag.clear();
        headers->accept_ranges.clear();
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }
    std::string name = StringUtils::to_lower(line.substr(0, colon));
    std::string value = line.substr(colon + 1);
    StringUtils::trim(name);
    StringUtils::trim(value);
    if (name == "etag") {
        headers->etag = value;
    } else if (name == "accept-ranges") {
        headers->accept_ranges = StringUtils::to_lower(value);
    }
    return total;
}

SourceIdentity CurlRangeFetcher::probe() {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> easy(curl_easy_init(), &curl_easy_cleanup);
    if (!easy) {
        throw TransportError("Failed to create curl handle for " + url_);
    }

    ProbeHeaders headers;
    char errbuf[CURL_ERROR_SIZE] = {};
    apply_common_options(easy.get());
    curl_easy_setopt(easy.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(easy.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(easy.get(), CURLOPT_HEADERFUNCTION, &CurlRangeFetcher::header_callback);
    curl_easy_setopt(easy.get(), CURLOPT_HEADERDATA, &headers);

    const CURLcode code = curl_easy_perform(easy.get());
    curl_easy_getinfo(easy.get(), CURLINFO_RESPONSE_CODE, &headers.status);
    if (code == CURLE_HTTP_RETURNED_ERROR) {
        throw TransportError("HTTP " + std::to_string(headers.status) + " probing " + url_,
                             is_retryable_status(headers.status), headers.status);
    }
    if (code != CURLE_OK) {
        const std::string detail = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(code);
        throw TransportError("Probe of " + url_ + " failed: " + detail, is_retryable_code(code));
    }

    SourceIdentity identity;
    if (!headers.etag.empty()) {
        identity.fingerprint = headers.etag;
    }
    identity.supports_range = headers.accept_ranges == "bytes";
    LogUtils::debug("Probed {}: etag={} ranges={}", url_,
                    identity.fingerprint.value_or("<none>"), identity.supports_range);
    return identity;
}
