#pragma once

#include <cstdint>

// Tagged printf-style logging. Output goes through printf, so on the Pico it
// follows whatever pico_stdio backend (USB/UART) the executable enables.

#define RM690B0_LOG_LEVEL_NONE  0
#define RM690B0_LOG_LEVEL_ERROR 1
#define RM690B0_LOG_LEVEL_WARN  2
#define RM690B0_LOG_LEVEL_INFO  3
#define RM690B0_LOG_LEVEL_DEBUG 4

// Compile-time ceiling; calls above it vanish
#ifndef RM690B0_LOG_LEVEL
#define RM690B0_LOG_LEVEL RM690B0_LOG_LEVEL_INFO
#endif

namespace rm690b0::log {

enum class Level : uint8_t {
    None = RM690B0_LOG_LEVEL_NONE,
    Error = RM690B0_LOG_LEVEL_ERROR,
    Warn = RM690B0_LOG_LEVEL_WARN,
    Info = RM690B0_LOG_LEVEL_INFO,
    Debug = RM690B0_LOG_LEVEL_DEBUG,
};

// Runtime filter below the compile-time ceiling
void set_level(Level level);
Level level();

void write(Level level, const char* tag, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace rm690b0::log

#if RM690B0_LOG_LEVEL >= RM690B0_LOG_LEVEL_ERROR
#define RM690B0_LOGE(tag, fmt, ...) ::rm690b0::log::write(::rm690b0::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#else
#define RM690B0_LOGE(tag, fmt, ...) ((void)0)
#endif

#if RM690B0_LOG_LEVEL >= RM690B0_LOG_LEVEL_WARN
#define RM690B0_LOGW(tag, fmt, ...) ::rm690b0::log::write(::rm690b0::log::Level::Warn, tag, fmt, ##__VA_ARGS__)
#else
#define RM690B0_LOGW(tag, fmt, ...) ((void)0)
#endif

#if RM690B0_LOG_LEVEL >= RM690B0_LOG_LEVEL_INFO
#define RM690B0_LOGI(tag, fmt, ...) ::rm690b0::log::write(::rm690b0::log::Level::Info, tag, fmt, ##__VA_ARGS__)
#else
#define RM690B0_LOGI(tag, fmt, ...) ((void)0)
#endif

#if RM690B0_LOG_LEVEL >= RM690B0_LOG_LEVEL_DEBUG
#define RM690B0_LOGD(tag, fmt, ...) ::rm690b0::log::write(::rm690b0::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#else
#define RM690B0_LOGD(tag, fmt, ...) ((void)0)
#endif
