#pragma once
/*
 * Logging
 *
 * Purpose: printf-style file log; the screen belongs to ncurses, so nothing
 * here writes to stdout/stderr once the terminal is up.
 * Usage: log_open(path, level) once in main; WT_LOGI("TAG", "fmt %d", x).
 */
#include <string>

// WT_LOG_LEVEL (compile-time ceiling)
//   0: errors only, 1: +warn/info, 2: +debug, 3: +trace
#ifndef WT_LOG_LEVEL
#define WT_LOG_LEVEL 2
#endif

#if (WT_LOG_LEVEL < 0) || (WT_LOG_LEVEL > 3)
#error "WT_LOG_LEVEL must be 0..3"
#endif

bool log_open(const std::string& path, int runtime_level, std::string& msg);
void log_close();
bool log_enabled(int level);
// prefix is the severity mark written before the tag, e.g. "[W]".
void log_write(const char* prefix, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#define WT__LOG(level, prefix, tag, fmt, ...) \
  do { if (log_enabled(level)) log_write(prefix, tag, fmt, ##__VA_ARGS__); } while (0)

// Always on
#define WT_LOGE(tag, fmt, ...) WT__LOG(0, "[E]", tag, fmt, ##__VA_ARGS__)

#if (WT_LOG_LEVEL >= 1)
  #define WT_LOGW(tag, fmt, ...) WT__LOG(1, "[W]", tag, fmt, ##__VA_ARGS__)
  #define WT_LOGI(tag, fmt, ...) WT__LOG(1, "[I]", tag, fmt, ##__VA_ARGS__)
#else
  #define WT_LOGW(tag, fmt, ...) do {} while (0)
  #define WT_LOGI(tag, fmt, ...) do {} while (0)
#endif

#if (WT_LOG_LEVEL >= 2)
  #define WT_LOGD(tag, fmt, ...) WT__LOG(2, "[D]", tag, fmt, ##__VA_ARGS__)
#else
  #define WT_LOGD(tag, fmt, ...) do {} while (0)
#endif

#if (WT_LOG_LEVEL >= 3)
  #define WT_LOGT(tag, fmt, ...) WT__LOG(3, "[T]", tag, fmt, ##__VA_ARGS__)
#else
  #define WT_LOGT(tag, fmt, ...) do {} while (0)
#endif
