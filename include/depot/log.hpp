#pragma once

#include <depot/result.hpp>
#include <string>

namespace depot::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

// Applies DEPOT_LOG=<level> and NO_COLOR from the environment.
// An unknown DEPOT_LOG value is reported with warn() and ignored.
void init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace depot::log
