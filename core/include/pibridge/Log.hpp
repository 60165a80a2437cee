// Minimal logging utility (header-only) for the pibridge core.
#pragma once
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace pibridge {

inline bool logEnabled() {
    const char* v = std::getenv("PIBRIDGE_LOG");
    return v && *v && *v != '0';
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[pibridge][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace pibridge

#define PIBRIDGE_LOGI(fmt, ...) \
    do { \
        if (pibridge::logEnabled()) \
            pibridge::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define PIBRIDGE_LOGW(fmt, ...) \
    do { \
        if (pibridge::logEnabled()) \
            pibridge::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define PIBRIDGE_LOGE(fmt, ...) \
    do { \
        if (pibridge::logEnabled()) \
            pibridge::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
