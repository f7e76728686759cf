#pragma once

#include <envcast/result.hpp>
#include <string>

namespace envcast::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Every line starts with "[envcast] " so it stands out from the server's
// output in interleaved container logs.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive).
Result<Level> parse_level(const std::string& name);

} // namespace envcast::log
