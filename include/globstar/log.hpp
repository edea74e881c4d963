#pragma once

#include <cstdio>
#include <string>

// Leveled printf-style diagnostics. The walk reports skipped directories at
// Debug and the matcher cache reports compiles and evictions at Trace.
// Until set_level() is called the threshold comes from $GLOBSTAR_LOG
// (a level name), defaulting to Info.
namespace globstar::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True if a message at `lvl` would be written.
bool enabled(Level lvl);

// Color defaults to on when the output is a terminal and $NO_COLOR is unset.
void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect messages (default stderr). The stream is not owned.
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name(); false if `name` is not a level
bool parse_level(const std::string& name, Level& out);

} // namespace globstar::log
