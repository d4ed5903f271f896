#include "config.hpp"
#include "file_io.hpp"
#include "logging.hpp"
#include "text_util.hpp"
#include "theme_registry.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

bool parse_on_off(const std::string& s, bool& out) {
  std::string v = ascii_lower(s);
  if (v == "on" || v == "true" || v == "yes" || v == "1") { out = true; return true; }
  if (v == "off" || v == "false" || v == "no" || v == "0") { out = false; return true; }
  return false;
}

bool parse_int_in(const std::string& s, int min, int max, int& out) {
  if (s.empty() || s.size() > 9) return false;
  bool digits = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!digits) return false;
  int v = std::stoi(s);
  if (v < min || v > max) return false;
  out = v;
  return true;
}

static std::string join_args(const std::vector<std::string>& args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i) out += ' ';
    out += args[i];
  }
  return out;
}

ConfigLoader::ConfigLoader(AppConfig& cfg) : cfg_(cfg) {
  register_commands();
}

void ConfigLoader::register_commands() {
  auto path_setting = [this](const char* name, std::filesystem::path AppConfig::*field) {
    registry_.register_command(std::string("set ") + name,
      [this, name, field](const std::vector<std::string>& args, std::string& msg) {
        if (args.empty()) { msg = std::string("set ") + name + ": use set " + name + " <path>"; return false; }
        cfg_.*field = join_args(args);
        msg = std::string(name) + "=" + (cfg_.*field).string();
        return true;
      });
  };
  path_setting("words", &AppConfig::words_file);
  path_setting("progress", &AppConfig::progress_file);
  path_setting("notes", &AppConfig::notes_dir);

  registry_.register_command("set theme", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set theme: use set theme <name>"; return false; }
    ThemeRegistry themes;
    if (!themes.select(args[0])) { msg = "set theme: unknown theme: " + args[0]; return false; }
    cfg_.theme = args[0];
    msg = "theme=" + args[0];
    return true;
  });
  registry_.register_command("set boss_style", [this](const std::vector<std::string>& args, std::string& msg) {
    BossStyle s;
    if (args.size() != 1 || !boss_parse_style(args[0], s)) { msg = "set boss_style: use set boss_style tail|ls"; return false; }
    cfg_.boss_style = s;
    msg = std::string("boss_style=") + boss_style_name(s);
    return true;
  });
  registry_.register_command("set boss_quit", [this](const std::vector<std::string>& args, std::string& msg) {
    bool v;
    if (args.size() != 1 || !parse_on_off(args[0], v)) { msg = "set boss_quit: use set boss_quit on|off"; return false; }
    cfg_.boss_quit = v;
    msg = v ? "boss_quit on" : "boss_quit off";
    return true;
  });
  registry_.register_command("set tick_ms", [this](const std::vector<std::string>& args, std::string& msg) {
    int v;
    if (args.size() != 1 || !parse_int_in(args[0], 50, 60000, v)) { msg = "set tick_ms: use a number in 50..60000"; return false; }
    cfg_.tick_ms = v;
    msg = "tick_ms=" + std::to_string(v);
    return true;
  });
  registry_.register_command("set ai_command", [this](const std::vector<std::string>& args, std::string& msg) {
    cfg_.ai_command = join_args(args);
    msg = cfg_.ai_command.empty() ? "ai_command cleared" : "ai_command=" + cfg_.ai_command;
    return true;
  });
  registry_.register_command("set ai_timeout", [this](const std::vector<std::string>& args, std::string& msg) {
    int v;
    if (args.size() != 1 || !parse_int_in(args[0], 1, 3600, v)) { msg = "set ai_timeout: use seconds in 1..3600"; return false; }
    cfg_.ai_timeout = v;
    msg = "ai_timeout=" + std::to_string(v);
    return true;
  });
  registry_.register_command("set search", [this](const std::vector<std::string>& args, std::string& msg) {
    SearchMode m;
    if (args.size() != 1 || !parse_search_mode(args[0], m)) { msg = "set search: use set search auto|provider|offline"; return false; }
    cfg_.gen.search = m;
    msg = std::string("search=") + search_mode_name(m);
    return true;
  });
  registry_.register_command("set plain", [this](const std::vector<std::string>& args, std::string& msg) {
    bool v;
    if (args.size() != 1 || !parse_on_off(args[0], v)) { msg = "set plain: use set plain on|off"; return false; }
    cfg_.gen.plain = v;
    msg = v ? "plain on" : "plain off";
    return true;
  });
  registry_.register_command("set seed", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1 || args[0].empty() ||
        !std::all_of(args[0].begin(), args[0].end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
      msg = "set seed: use a non-negative number";
      return false;
    }
    try {
      cfg_.seed = std::stoull(args[0]);
    } catch (const std::out_of_range&) {
      msg = "set seed: number too large";
      return false;
    }
    msg = "seed=" + args[0];
    return true;
  });
  registry_.register_command("set log_file", [this](const std::vector<std::string>& args, std::string& msg) {
    cfg_.log_file = join_args(args);
    msg = cfg_.log_file.empty() ? "logging off" : "log_file=" + cfg_.log_file;
    return true;
  });
  registry_.register_command("set log_level", [this](const std::vector<std::string>& args, std::string& msg) {
    int v;
    if (args.size() != 1 || !parse_int_in(args[0], 0, 3, v)) { msg = "set log_level: use 0..3"; return false; }
    cfg_.log_level = v;
    msg = "log_level=" + std::to_string(v);
    return true;
  });
  registry_.register_command("bind", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 3) { msg = "bind: use bind <context> <key> <action>"; return false; }
    return cfg_.keys.bind(args[0], args[1], args[2], msg);
  });
}

bool ConfigLoader::execute_line(const std::string& line, std::string& msg) {
  msg.clear();
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd.empty()) return true;
  if (cmd == "set") {
    if (args.empty()) { msg = "set: use set <name> <value>"; return false; }
    // set name=value
    std::string name = args[0];
    std::vector<std::string> subargs;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      if (eq + 1 < name.size()) subargs.push_back(name.substr(eq + 1));
      name = name.substr(0, eq);
    }
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry_.has("set " + name)) { msg = "set: unknown option: " + name; return false; }
    return registry_.execute("set " + name, subargs, msg);
  }
  return registry_.execute(cmd, args, msg);
}

bool ConfigLoader::load_file(const std::filesystem::path& path, std::vector<std::string>& problems, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!execute_line(lines[i], m)) {
      problems.push_back(path.string() + ":" + std::to_string(i + 1) + ": " + m);
      WT_LOGW("CONFIG", "%s:%zu: %s", path.string().c_str(), i + 1, m.c_str());
    }
  }
  msg = "loaded " + path.string();
  return true;
}

std::optional<std::filesystem::path> find_rc_file(const std::optional<std::filesystem::path>& explicit_path) {
  if (explicit_path) return explicit_path;
  std::error_code ec;
  std::filesystem::path local = "wordtui.rc";
  if (std::filesystem::exists(local, ec)) return local;
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  auto p = std::filesystem::path(home) / ".wordtuirc";
  if (std::filesystem::exists(p, ec)) return p;
  return std::nullopt;
}
