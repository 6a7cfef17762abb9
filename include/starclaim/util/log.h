#pragma once

#include <string>

namespace starclaim::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Accepts "debug", "info", "warn"/"warning", "error" and "off" (case-insensitive).
// Returns false and leaves *out untouched for anything else.
bool parse_level(const std::string& text, Level* out);

// True when a message at `l` would currently be written. Useful to skip
// building expensive diagnostic strings.
bool enabled(Level l);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace starclaim::log
