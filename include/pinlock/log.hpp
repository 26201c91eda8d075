#pragma once

#include <pinlock/result.hpp>
#include <string>
#include <cstdio>

namespace pinlock::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (defaults to stderr). Passing nullptr restores stderr.
void set_sink(std::FILE* sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name; case-sensitive ("warn", not "WARN")
Result<Level> parse_level(const std::string& name);

} // namespace pinlock::log
