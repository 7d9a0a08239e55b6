#pragma once

#include <optional>
#include <string>

// Leveled diagnostics on stderr, "level: message" per line. Output goes to
// stderr only, so it never mixes with the catalog or path lists on stdout.
namespace pathmatch::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Messages below the threshold are dropped. Default: Warn.
void set_level(Level lvl);

// Force the colored level prefix on or off; by default it is on when stderr
// is a terminal.
void set_color_enabled(bool enabled);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);
std::optional<Level> parse_level(const std::string& name);

} // namespace pathmatch::log
