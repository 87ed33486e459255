#pragma once

#include <string>
#include <string_view>

namespace taktkb::log {

enum class Level { Info, Warn, Error };

// Accepts "info", "warn" or "error" in any case. Throws std::runtime_error otherwise.
Level parse_level(std::string_view name);
const char* level_name(Level level);

// Messages below the threshold are dropped. The default is Level::Info.
void set_threshold(Level level);
Level threshold();

// "[<timestamp>][<LEVEL>] <message>"
std::string format_line(Level level, std::string_view timestamp, std::string_view message);

// Info goes to stdout, warn and error to stderr.
void write(Level level, std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace taktkb::log
