#include "TimestampUtils.hpp"
#include <cassert>
#include <chrono>
#include <iostream>

void test_epoch_formatting() {
    std::chrono::system_clock::time_point tp{};
    assert(TimestampUtils::to_iso8601_utc(tp) == "1970-01-01T00:00:00.000000Z");

    tp += std::chrono::seconds(1714566896) + std::chrono::microseconds(123456);
    assert(TimestampUtils::to_iso8601_utc(tp) == "2024-05-01T12:34:56.123456Z");
    std::cout << "test_epoch_formatting passed" << std::endl;
}

void test_now_shape() {
    const auto s = TimestampUtils::now_iso8601_utc();
    assert(s.size() == 27);
    assert(s[4] == '-' && s[10] == 'T' && s.back() == 'Z');
    std::cout << "test_now_shape passed" << std::endl;
}

void test_seconds_between() {
    auto a = std::chrono::steady_clock::now();
    auto b = a + std::chrono::milliseconds(1500);
    double d = TimestampUtils::seconds_between(a, b);
    (void)d;
    assert(d > 1.49 && d < 1.51);
    std::cout << "test_seconds_between passed" << std::endl;
}

int main() {
    test_epoch_formatting();
    test_now_shape();
    test_seconds_between();
    std::cout << "All TimestampUtils tests passed." << std::endl;
    return 0;
}
