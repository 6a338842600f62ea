#include <aiiap/log.hpp>
#include <cstdarg>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace aiiap::log {

static Level s_level = Info;
static std::FILE* s_out = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* out_stream() {
    return s_out ? s_out : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out_stream())) != 0;
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(std::FILE* out) {
    s_out = out;
    s_color_initialized = false;
}

std::FILE* get_output() {
    return out_stream();
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
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[34m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

static void vlog(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    std::FILE* out = out_stream();
    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
    std::fflush(out);
}

#define AIIAP_LOG_FN(name, lvl)          \
    void name(const char* fmt, ...) {    \
        va_list args;                    \
        va_start(args, fmt);             \
        vlog(lvl, fmt, args);            \
        va_end(args);                    \
    }

AIIAP_LOG_FN(trace, Trace)
AIIAP_LOG_FN(debug, Debug)
AIIAP_LOG_FN(info, Info)
AIIAP_LOG_FN(warn, Warn)
AIIAP_LOG_FN(error, Error)

#undef AIIAP_LOG_FN

} // namespace aiiap::log
