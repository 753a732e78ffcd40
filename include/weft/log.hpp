#pragma once

#include <string>
#include <cstdio>

namespace weft::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True when messages at `lvl` would be written
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (default stderr). Passing nullptr restores stderr.
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace".."error" (case-sensitive). Returns false on unknown names.
bool parse_level(const std::string& name, Level& out);

} // namespace weft::log
