#include "util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include "util/time.hpp"

namespace taktkb::log {
namespace {

std::atomic<Level> g_threshold{Level::Info};

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_threshold.load());
}

}  // namespace

Level parse_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "info") {
        return Level::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return Level::Warn;
    }
    if (lowered == "error") {
        return Level::Error;
    }
    throw std::runtime_error("unknown log level \"" + std::string(name) + '"');
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

void set_threshold(Level level) { g_threshold.store(level); }

Level threshold() { return g_threshold.load(); }

std::string format_line(Level level, std::string_view timestamp, std::string_view message) {
    std::string line;
    line.reserve(timestamp.size() + message.size() + 10);
    line += '[';
    line += timestamp;
    line += "][";
    line += level_name(level);
    line += "] ";
    line += message;
    return line;
}

void write(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    const std::string line = format_line(level, time::current_time_iso8601(), message);
    // stdout carries the tools' result lines, so only progress goes there.
    std::ostream& out = (level == Level::Info) ? std::cout : std::cerr;

    const std::lock_guard<std::mutex> lock(output_mutex());
    out << line << std::endl;
}

void info(std::string_view message) { write(Level::Info, message); }

void warn(std::string_view message) { write(Level::Warn, message); }

void error(std::string_view message) { write(Level::Error, message); }

}  // namespace taktkb::log
