#include <globstar/log.hpp>
#include <cstdarg>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace globstar::log {

namespace {

struct Sink {
    std::FILE* out = nullptr;   // null means stderr
    Level level = Info;
    bool level_set = false;
    bool color = false;
    bool color_set = false;
};

Sink& sink() {
    static Sink s;
    return s;
}

std::FILE* stream() {
    std::FILE* out = sink().out;
    return out ? out : stderr;
}

const char* const kNames[] = {"trace", "debug", "info", "warn", "error"};
const char* const kColors[] = {
    "\033[90m",  // gray
    "\033[36m",  // cyan
    "\033[32m",  // green
    "\033[33m",  // yellow
    "\033[31m",  // red
};

Level threshold() {
    Sink& s = sink();
    if (!s.level_set) {
        const char* env = std::getenv("GLOBSTAR_LOG");
        Level lvl;
        if (env && parse_level(env, lvl)) s.level = lvl;
        s.level_set = true;
    }
    return s.level;
}

bool use_color() {
    Sink& s = sink();
    if (!s.color_set) {
        s.color = !std::getenv("NO_COLOR") && isatty(fileno(stream()));
        s.color_set = true;
    }
    return s.color;
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    std::FILE* out = stream();
    if (use_color()) {
        std::fprintf(out, "%s%s\033[0m: ", kColors[lvl], kNames[lvl]);
    } else {
        std::fprintf(out, "%s: ", kNames[lvl]);
    }
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
    std::fflush(out);
}

} // namespace

void set_level(Level lvl) {
    sink().level = lvl;
    sink().level_set = true;
}

Level get_level() { return threshold(); }

bool enabled(Level lvl) { return lvl >= threshold(); }

void set_color_enabled(bool enabled) {
    sink().color = enabled;
    sink().color_set = true;
}

bool is_color_enabled() { return use_color(); }

void set_output(std::FILE* out) { sink().out = out; }

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Error) return "unknown";
    return kNames[lvl];
}

bool parse_level(const std::string& name, Level& out) {
    for (int i = Trace; i <= Error; i++) {
        if (name == kNames[i]) {
            out = static_cast<Level>(i);
            return true;
        }
    }
    return false;
}

#define GLOBSTAR_LOG_ENTRY(fn, lvl)      \
    void fn(const char* fmt, ...) {      \
        va_list args;                    \
        va_start(args, fmt);             \
        emit(lvl, fmt, args);            \
        va_end(args);                    \
    }

GLOBSTAR_LOG_ENTRY(trace, Trace)
GLOBSTAR_LOG_ENTRY(debug, Debug)
GLOBSTAR_LOG_ENTRY(info, Info)
GLOBSTAR_LOG_ENTRY(warn, Warn)
GLOBSTAR_LOG_ENTRY(error, Error)

#undef GLOBSTAR_LOG_ENTRY

} // namespace globstar::log
