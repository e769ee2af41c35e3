#pragma once

#include <string>
#include <cstdio>

namespace svi {
class Redactor;
}

namespace svi::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Every message is passed through the installed redactor before it is
// written, so substituted secrets never reach stderr.
void set_redactor(const Redactor& redactor);
void clear_redactor();
bool has_redactor();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); returns false for an unknown name
bool parse_level(const std::string& name, Level& out);

} // namespace svi::log
