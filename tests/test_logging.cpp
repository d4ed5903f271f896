#include "logging.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string read_all(const fs::path& p) {
  std::ifstream f(p);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

static void severity_marks() {
  auto path = fs::temp_directory_path() / ("wordtui_log_" + std::to_string(::getpid()) + ".log");
  fs::remove(path);
  std::string msg;
  assert(log_open(path.string(), 1, msg));
  WT_LOGW("STORE", "bad counter %d", 7);
  WT_LOGI("MAIN", "started");
  WT_LOGE("MAIN", "fatal %s", "x");
  WT_LOGD("SESSION", "hidden at level 1");
  log_close();

  std::string text = read_all(path);
  assert(text.find("[W] STORE bad counter 7") != std::string::npos);
  assert(text.find("[I] MAIN started") != std::string::npos);
  assert(text.find("[E] MAIN fatal x") != std::string::npos);
  assert(text.find("[I] STORE") == std::string::npos);
  assert(text.find("hidden") == std::string::npos);
  fs::remove(path);
}

static void errors_only_level() {
  auto path = fs::temp_directory_path() / ("wordtui_log0_" + std::to_string(::getpid()) + ".log");
  fs::remove(path);
  std::string msg;
  assert(log_open(path.string(), 0, msg));
  WT_LOGW("STORE", "dropped");
  WT_LOGE("STORE", "kept");
  log_close();
  std::string text = read_all(path);
  assert(text.find("dropped") == std::string::npos);
  assert(text.find("[E] STORE kept") != std::string::npos);
  fs::remove(path);
}

int main() {
  severity_marks();
  errors_only_level();
  return 0;
}
