#include "RangeStream.hpp"
#include "IngestErrors.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }
    // Cap the exponent; 2^20 * base is already days for any sane base
    const int exponent = std::min(attempt - 1, 20);
    return base_delay * (int64_t{1} << exponent);
}

RangeStream::RangeStream(std::unique_ptr<RangeFetcher> fetcher,
                         uint64_t start_byte,
                         size_t chunk_size,
                         RetryPolicy policy,
                         Sleeper sleeper)
    : fetcher_(std::move(fetcher)),
      start_byte_(start_byte),
      position_(start_byte),
      chunk_size_(chunk_size),
      policy_(policy),
      sleeper_(std::move(sleeper)) {
    if (!fetcher_) {
        throw std::invalid_argument("RangeStream requires a fetcher");
    }
    if (chunk_size_ == 0) {
        throw std::invalid_argument("RangeStream chunk size must be positive");
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

RangeStream::~RangeStream() {
    fetcher_->close();
}

bool RangeStream::next(std::string& chunk) {
    while (!finished_) {
        try {
            if (!connected_) {
                ++connection_attempts_;
                fetcher_->open(position_);
                connected_ = true;
            }

            if (fetcher_->read(chunk, chunk_size_)) {
                position_ += chunk.size();
                consecutive_failures_ = 0;
                return true;
            }

            fetcher_->close();
            connected_ = false;
            finished_ = true;
            LogUtils::debug("Source {} exhausted at byte {}", fetcher_->describe(), position_);
        } catch (const TransportError& e) {
            fetcher_->close();
            connected_ = false;

            if (!e.retryable()) {
                finished_ = true;
                throw;
            }

            ++consecutive_failures_;
            if (consecutive_failures_ > policy_.max_retries) {
                finished_ = true;
                throw TransportError("Failed after " + std::to_string(policy_.max_retries) +
                                     " retries: " + e.what(), false, e.status_code());
            }

            ++total_retries_;
            const auto delay = policy_.delay_for(consecutive_failures_);
            LogUtils::warn("Transfer from {} failed at byte {} ({}); retry {}/{} in {} ms",
                           fetcher_->describe(), position_, e.what(),
                           consecutive_failures_, policy_.max_retries, delay.count());
            sleeper_(delay);
        }
    }
    return false;
}
