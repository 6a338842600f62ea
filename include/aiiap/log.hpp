#pragma once

#include <cstdio>

namespace aiiap::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination stream; defaults to stderr. Passing nullptr restores stderr.
// Changing the stream re-runs colour detection on the next message.
void set_output(std::FILE* out);
std::FILE* get_output();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace aiiap::log
