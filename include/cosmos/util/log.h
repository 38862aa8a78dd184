#pragma once

#include <string>

namespace cosmos::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Parses "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
// Returns false and leaves `out` untouched on unknown input.
bool parse_level(const std::string& raw, Level& out);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace cosmos::log
