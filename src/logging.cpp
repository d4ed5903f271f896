#include "logging.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

static std::FILE* g_log = nullptr;
static std::atomic<bool> g_open{false};
static std::atomic<int> g_level{1};
static std::mutex g_log_mu; // batch worker threads may log too

bool log_open(const std::string& path, int runtime_level, std::string& msg) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (g_log) { std::fclose(g_log); g_log = nullptr; }
  g_open = false;
  g_level = runtime_level;
  if (path.empty()) return true;
  g_log = std::fopen(path.c_str(), "a");
  if (!g_log) { msg = std::string("can not open log file: ") + path; return false; }
  g_open = true;
  return true;
}

void log_close() {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_open = false;
  if (g_log) { std::fclose(g_log); g_log = nullptr; }
}

bool log_enabled(int level) {
  return g_open.load() && level <= g_level.load();
}

void log_write(const char* prefix, const char* tag, const char* fmt, ...) {
  char body[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(body, sizeof(body), fmt, ap);
  va_end(ap);

  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

  std::lock_guard<std::mutex> lk(g_log_mu);
  if (!g_log) return;
  std::fprintf(g_log, "%s %s %s %s\n", stamp, prefix, tag, body);
  std::fflush(g_log);
}
