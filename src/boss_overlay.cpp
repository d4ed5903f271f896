#include "boss_overlay.hpp"
#include "rng.hpp"
#include <cstdio>

static const char* kLogMessages[] = {
  "Application started successfully",
  "Loading configuration from config.json",
  "Database connection established",
  "Processing user request",
  "Cache refresh completed",
  "Background task completed",
  "Request processed in 125ms",
  "Cleaning up temporary files",
  "System status: healthy",
  "Service heartbeat OK",
};
static const char* kLogLevels[] = {"INFO", "DEBUG", "WARNING"};

struct FakeFile { bool dir; const char* name; };
static const FakeFile kFiles[] = {
  {true,  "config"},
  {false, ".bash_logout"},
  {false, ".bashrc"},
  {true,  ".cache"},
  {false, ".profile"},
  {false, "application.log"},
  {false, "backup_script.sh"},
  {true,  "temp"},
  {false, "data.json"},
  {false, "error.log"},
  {false, "main_app"},
  {false, "report.txt"},
};

static std::tm local_tm(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

bool boss_parse_style(const std::string& s, BossStyle& out) {
  if (s == "tail" || s == "log") { out = BossStyle::TailLog; return true; }
  if (s == "ls" || s == "dir") { out = BossStyle::LsDirectory; return true; }
  return false;
}

const char* boss_style_name(BossStyle s) {
  return s == BossStyle::LsDirectory ? "ls" : "tail";
}

std::string boss_title(BossStyle style) {
  return style == BossStyle::LsDirectory ? "ls -la /home/user/project"
                                         : "tail -f /var/log/application.log";
}

std::string format_log_stamp(std::time_t t) {
  std::tm tm = local_tm(t);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

// "Sep 17 14:30", like ls
std::string format_ls_stamp(std::time_t t) {
  static const char* months[] = {"Jan","Feb","Mar","Apr","May","Jun","Jul","Aug","Sep","Oct","Nov","Dec"};
  std::tm tm = local_tm(t);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s %2d %02d:%02d", months[tm.tm_mon % 12], tm.tm_mday, tm.tm_hour, tm.tm_min);
  return buf;
}

static BossLine make_log_line(std::time_t at, std::uint64_t& rng) {
  const int nlevels = static_cast<int>(sizeof(kLogLevels) / sizeof(kLogLevels[0]));
  const int nmsgs = static_cast<int>(sizeof(kLogMessages) / sizeof(kLogMessages[0]));
  const char* level = kLogLevels[rand_int(rng, 0, nlevels - 1)];
  const char* msg = kLogMessages[rand_int(rng, 0, nmsgs - 1)];
  BossLine line;
  line.text = "[" + format_log_stamp(at) + "] " + level + ": " + msg;
  std::string lv = level;
  line.tone = lv == "WARNING" ? BossLine::Tone::Warn : (lv == "DEBUG" ? BossLine::Tone::Debug : BossLine::Tone::Info);
  return line;
}

static BossLine make_ls_line(bool dir, bool exec, int size, std::time_t at, const std::string& name) {
  const char* perm = dir ? "drwxr-xr-x" : (exec ? "-rwxr-xr-x" : "-rw-r--r--");
  char buf[160];
  std::snprintf(buf, sizeof(buf), "%-10s  1 user user %7d %s %s", perm, size, format_ls_stamp(at).c_str(), name.c_str());
  BossLine line;
  line.text = buf;
  line.tone = dir ? BossLine::Tone::Dir : (exec ? BossLine::Tone::Exec : BossLine::Tone::Plain);
  return line;
}

static bool looks_executable(const std::string& name) {
  auto ends_with = [&](const std::string& suf) {
    return name.size() >= suf.size() && name.compare(name.size() - suf.size(), suf.size(), suf) == 0;
  };
  return ends_with(".sh") || ends_with("_app");
}

std::vector<BossLine> boss_initial_lines(BossStyle style, std::time_t now, int count, std::uint64_t& rng) {
  std::vector<BossLine> out;
  if (style == BossStyle::TailLog) {
    if (count < 1) count = 1;
    for (int i = count; i > 0; --i) out.push_back(make_log_line(now - i, rng));
    return out;
  }
  const int nfiles = static_cast<int>(sizeof(kFiles) / sizeof(kFiles[0]));
  out.push_back({"total " + std::to_string((nfiles + 2) * 4), BossLine::Tone::Plain});
  out.push_back(make_ls_line(true, false, 4096, now, "."));
  out.push_back(make_ls_line(true, false, 4096, now - 60, ".."));
  for (const auto& f : kFiles) {
    std::time_t at = now - rand_int(rng, 0, 9) * 60 - rand_int(rng, 0, 59);
    int size = f.dir ? 4096 : rand_int(rng, 512, 16384);
    bool exec = !f.dir && (looks_executable(f.name) || rand_int(rng, 0, 3) == 0);
    out.push_back(make_ls_line(f.dir, exec, size, at, f.name));
  }
  return out;
}

BossLine boss_next_line(BossStyle style, unsigned tick, std::time_t now, std::uint64_t& rng) {
  if (style == BossStyle::TailLog) return make_log_line(now, rng);
  char name[48];
  std::snprintf(name, sizeof(name), "build_%04u.log", tick);
  return make_ls_line(false, false, rand_int(rng, 512, 16384), now, name);
}
