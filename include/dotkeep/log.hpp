#pragma once

#include <optional>
#include <string>
#include <cstdio>

namespace dotkeep::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn"/"warning" or "error" (case-insensitive)
std::optional<Level> parse_level(const std::string& name);

// Apply DOTKEEP_LOG from the environment if it names a valid level.
// Returns true when the level was changed.
bool init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (defaults to stderr). Passing nullptr restores stderr.
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Log a multi-line body (e.g. captured script output) under a title,
// each line indented. Empty bodies are not logged.
void block(Level lvl, const std::string& title, const std::string& body);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace dotkeep::log
