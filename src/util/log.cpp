#include <dotkeep/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include <unistd.h>

namespace dotkeep::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::FILE* s_out = nullptr;

static std::FILE* out() {
    return s_out ? s_out : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

std::optional<Level> parse_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Trace;
    if (lower == "debug") return Debug;
    if (lower == "info") return Info;
    if (lower == "warn" || lower == "warning") return Warn;
    if (lower == "error") return Error;
    return std::nullopt;
}

bool init_from_env() {
    const char* env = std::getenv("DOTKEEP_LOG");
    if (!env) return false;

    auto lvl = parse_level(env);
    if (!lvl) {
        warn("ignoring unknown DOTKEEP_LOG level '%s'", env);
        return false;
    }
    set_level(*lvl);
    return true;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(std::FILE* stream) {
    s_out = stream;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

static void write_prefix(Level lvl) {
    init_color();
    if (s_color_enabled) {
        std::fprintf(out(), "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(out(), "%s: ", level_name(lvl));
    }
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;

    write_prefix(lvl);
    std::vfprintf(out(), fmt, args);
    std::fprintf(out(), "\n");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

void block(Level lvl, const std::string& title, const std::string& body) {
    if (lvl < s_level || body.empty()) return;

    write_prefix(lvl);
    std::fprintf(out(), "%s\n", title.c_str());

    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        std::fprintf(out(), "    | %s\n", line.c_str());
    }
}

} // namespace dotkeep::log
