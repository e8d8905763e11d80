#pragma once

#include <string>
#include <cstdio>

namespace gitsnip::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace".."error" (case-insensitive). Returns false on unknown names.
bool parse_level(const std::string& name, Level& out);

} // namespace gitsnip::log
