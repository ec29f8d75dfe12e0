#include "TimestampUtils.hpp"
#include <ctime>
#include <cstdio>

std::string TimestampUtils::to_iso8601_utc(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros.count()));
    return buf;
}

std::string TimestampUtils::now_iso8601_utc() {
    return to_iso8601_utc(std::chrono::system_clock::now());
}

double TimestampUtils::seconds_between(std::chrono::steady_clock::time_point from,
                                       std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}
