#pragma once

#include <string>
#include <optional>

namespace drift::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Parse "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
std::optional<Level> parse_level(const std::string& name);

// Apply DRIFT_LOG (a level name) if set. Returns false when the variable
// holds an unknown level; the current level is kept in that case.
bool init_from_env();

} // namespace drift::log
