#include "RangeStream.hpp"
#include "FakeRangeFetcher.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

namespace {

std::string make_payload(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>('a' + (i % 26));
    }
    return s;
}

RetryPolicy fast_policy(int retries) {
    RetryPolicy p;
    p.max_retries = retries;
    p.base_delay = std::chrono::milliseconds(100);
    return p;
}

std::string drain(RangeStream& stream) {
    std::string all, chunk;
    while (stream.next(chunk)) {
        assert(!chunk.empty());
        all += chunk;
    }
    return all;
}

} // namespace

void test_backoff_doubles() {
    RetryPolicy p;
    p.base_delay = std::chrono::milliseconds(10000);
    assert(p.delay_for(1).count() == 10000);
    assert(p.delay_for(2).count() == 20000);
    assert(p.delay_for(3).count() == 40000);
    std::cout << "test_backoff_doubles passed" << std::endl;
}

void test_plain_read_in_chunks() {
    auto state = std::make_shared<FakeSourceState>();
    state->data = make_payload(10000);

    RangeStream stream(std::make_unique<FakeRangeFetcher>(state), 0, 1024, fast_policy(3),
                       [](std::chrono::milliseconds) {});
    std::string chunk;
    size_t chunks = 0;
    std::string all;
    while (stream.next(chunk)) {
        assert(chunk.size() <= 1024);
        all += chunk;
        ++chunks;
    }
    assert(all == state->data);
    assert(chunks == 10);
    assert(stream.position() == 10000);
    assert(state->opens == 1);
    std::cout << "test_plain_read_in_chunks passed" << std::endl;
}

void test_start_offset() {
    auto state = std::make_shared<FakeSourceState>();
    state->data = make_payload(5000);

    RangeStream stream(std::make_unique<FakeRangeFetcher>(state), 3000, 4096, fast_policy(3),
                       [](std::chrono::milliseconds) {});
    assert(drain(stream) == state->data.substr(3000));
    assert(state->open_offsets.front() == 3000);
    std::cout << "test_start_offset passed" << std::endl;
}

void test_retry_resumes_without_duplication() {
    auto state = std::make_shared<FakeSourceState>();
    state->data = make_payload(8000);
    state->failures.push_back({1, 2500, true, 503});
    state->failures.push_back({2, 0, true, 0});

    std::vector<std::chrono::milliseconds> sleeps;
    RangeStream stream(std::make_unique<FakeRangeFetcher>(state), 0, 1000, fast_policy(5),
                       [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

    assert(drain(stream) == state->data);
    assert(state->opens == 3);
    assert(state->open_offsets[1] == 2500);
    assert(state->open_offsets[2] == 2500);
    assert(sleeps.size() == 2);
    assert(sleeps[0].count() == 100);
    assert(sleeps[1].count() == 200);
    assert(stream.retries() == 2);
    std::cout << "test_retry_resumes_without_duplication passed" << std::endl;
}

void test_counter_resets_after_progress() {
    auto state = std::make_shared<FakeSourceState>();
    state->data = make_payload(6000);
    // Three separate single failures, each followed by progress
    state->failures.push_back({1, 1000, true, 0});
    state->failures.push_back({2, 1000, true, 0});
    state->failures.push_back({3, 1000, true, 0});

    std::vector<std::chrono::milliseconds> sleeps;
    RangeStream stream(std::make_unique<FakeRangeFetcher>(state), 0, 500, fast_policy(1),
                       [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

    assert(drain(stream) == state->data);
    assert(sleeps.size() == 3);
    for (const auto& d : sleeps) {
        assert(d.count() == 100);
    }
    std::cout << "test_counter_resets_after_progress passed" << std::endl;
}

void test_retries_exhausted() {
    auto state = std::make_shared<FakeSourceState>();
    state->data = make_payload(100);
    for (int i = 1; i <= 10; ++i) {
        state->failures.push_back({i, 0, true, 503});
    }

    int sleeps = 0;
    RangeStream stream(std::make_unique<FakeRangeFetcher>(state), 0, 1024, fast_policy(2),
                       [&](std::chrono::milliseconds) { ++sleeps; });

    bool thrown = false;
    try {
        std::string chunk;
        stream.next(chunk);
    } catch (const TransportError& e) {
        thrown = true;
        assert(!e.retryable());
        assert(e.status_code() == 503);
    }
    assert(thrown);
    assert(state->opens == 3);
    assert(sleeps == 2);
    std::cout << "test_retries_exhausted passed" << std::endl;
}

void test_client_error_not_retried() {
    auto state = std::make_shared<FakeSourceState>();
    state->data = make_payload(100);
    state->failures.push_back({1, 0, false, 404});

    int sleeps = 0;
    RangeStream stream(std::make_unique<FakeRangeFetcher>(state), 0, 1024, fast_policy(5),
                       [&](std::chrono::milliseconds) { ++sleeps; });

    bool thrown = false;
    try {
        std::string chunk;
        stream.next(chunk);
    } catch (const TransportError& e) {
        thrown = true;
        assert(e.status_code() == 404);
    }
    assert(thrown);
    assert(state->opens == 1);
    assert(sleeps == 0);
    assert(stream.retries() == 0);
    std::cout << "test_client_error_not_retried passed" << std::endl;
}

int main() {
    test_backoff_doubles();
    test_plain_read_in_chunks();
    test_start_offset();
    test_retry_resumes_without_duplication();
    test_counter_resets_after_progress();
    test_retries_exhausted();
    test_client_error_not_retried();

    std::cout << "All RangeStream tests passed!" << std::endl;
    return 0;
}
