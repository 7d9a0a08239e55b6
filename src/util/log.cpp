#include <pathmatch/log.hpp>
#include <cstdarg>
#include <cstdio>

#include <unistd.h>

namespace pathmatch::log {

namespace {

struct Sink {
    Level threshold = Warn;
    std::optional<bool> color;  // unset: decide from isatty on first use
};

Sink& sink() {
    static Sink s;
    return s;
}

// Indexed by Level
constexpr const char* kNames[] = {"trace", "debug", "info", "warn", "error"};
constexpr const char* kColors[] = {
    "\033[90m",  // gray
    "\033[36m",  // cyan
    "\033[32m",  // green
    "\033[33m",  // yellow
    "\033[31m",  // red
};

bool colored() {
    auto& s = sink();
    if (!s.color) s.color = isatty(fileno(stderr)) != 0;
    return *s.color;
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < sink().threshold) return;

    if (colored()) {
        std::fprintf(stderr, "%s%s\033[0m: ", kColors[lvl], kNames[lvl]);
    } else {
        std::fprintf(stderr, "%s: ", kNames[lvl]);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace

void set_level(Level lvl) {
    sink().threshold = lvl;
}

void set_color_enabled(bool enabled) {
    sink().color = enabled;
}

const char* level_name(Level lvl) {
    return kNames[lvl];
}

std::optional<Level> parse_level(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == kNames[lvl]) return lvl;
    }
    return std::nullopt;
}

#define PATHMATCH_LOG_AT(lvl)        \
    va_list args;                    \
    va_start(args, fmt);             \
    emit(lvl, fmt, args);            \
    va_end(args)

void trace(const char* fmt, ...) { PATHMATCH_LOG_AT(Trace); }
void debug(const char* fmt, ...) { PATHMATCH_LOG_AT(Debug); }
void info(const char* fmt, ...)  { PATHMATCH_LOG_AT(Info); }
void warn(const char* fmt, ...)  { PATHMATCH_LOG_AT(Warn); }
void error(const char* fmt, ...) { PATHMATCH_LOG_AT(Error); }

#undef PATHMATCH_LOG_AT

} // namespace pathmatch::log
