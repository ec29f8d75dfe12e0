#pragma once

#include <chrono>
#include <cstdint>
#include <string>

class TimestampUtils {
public:
    // "2024-05-01T12:34:56.789012Z"
    static std::string to_iso8601_utc(std::chrono::system_clock::time_point tp);
    static std::string now_iso8601_utc();

    static double seconds_between(std::chrono::steady_clock::time_point from,
                                  std::chrono::steady_clock::time_point to);
};
