#include "util/time.hpp"

#include <cstdio>
#include <ctime>

namespace taktkb::time {

std::string format_iso8601(std::chrono::system_clock::time_point point) {
    const auto seconds_part = std::chrono::floor<std::chrono::seconds>(point);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(point - seconds_part).count();

    const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(seconds_part);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &epoch_seconds);
#else
    gmtime_r(&epoch_seconds, &utc);
#endif

    char date[32];
    const std::size_t written = std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%.*s.%03dZ", static_cast<int>(written), date,
                  static_cast<int>(millis));
    return stamp;
}

std::string current_time_iso8601() { return format_iso8601(std::chrono::system_clock::now()); }

Stopwatch::Stopwatch() : start_(std::chrono::steady_clock::now()) {}

long long Stopwatch::elapsed_ms() const {
    const auto elapsed = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

}  // namespace taktkb::time
