#include "rm690b0/log.hpp"

#include <cstdarg>
#include <cstdio>

namespace rm690b0::log {

namespace {
    Level g_level = static_cast<Level>(RM690B0_LOG_LEVEL);

    char level_char(Level l) {
        switch (l) {
            case Level::Error: return 'E';
            case Level::Warn:  return 'W';
            case Level::Info:  return 'I';
            case Level::Debug: return 'D';
            case Level::None:  break;
        }
        return '?';
    }
}

void set_level(Level level) { g_level = level; }
Level level() { return g_level; }

void write(Level lvl, const char* tag, const char* format, ...) {
    if (lvl == Level::None || static_cast<uint8_t>(lvl) > static_cast<uint8_t>(g_level)) return;
    std::printf("[%c] %s: ", level_char(lvl), tag ? tag : "-");
    va_list args;
    va_start(args, format);
    std::vprintf(format, args);
    va_end(args);
    std::printf("\n");
}

} // namespace rm690b0::log
