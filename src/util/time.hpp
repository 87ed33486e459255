#pragma once

#include <chrono>
#include <string>

namespace taktkb::time {

// UTC, millisecond precision: 2024-05-01T09:30:00.250Z
std::string format_iso8601(std::chrono::system_clock::time_point point);
std::string current_time_iso8601();

// Wall time of a tool run, reported in the closing log line.
class Stopwatch {
public:
    Stopwatch();

    long long elapsed_ms() const;

private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace taktkb::time
