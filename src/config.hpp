#pragma once
/*
 * Config
 *
 * Purpose: application settings and the rc-file loader.
 * rc lookup: `-c <path>`, else ./wordtui.rc, else $HOME/.wordtuirc.
 * Syntax: one command per line (`set <name> <value...>`, `bind <ctx> <key> <action>`);
 * '#', '"' and "//" start comments, a leading ':' is accepted.
 * Note: a bad line leaves the affected setting at its previous value.
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "boss_overlay.hpp"
#include "cmd_registry.hpp"
#include "keymap.hpp"
#include "note_generator.hpp"

struct AppConfig {
  std::filesystem::path words_file = "words.csv";
  std::filesystem::path progress_file = "progress.json";
  std::filesystem::path notes_dir = "ai_notes";
  std::string theme;              // empty: first registered theme
  BossStyle boss_style = BossStyle::TailLog;
  bool boss_quit = false;
  int tick_ms = 500;
  std::string ai_command;         // empty: offline generator
  int ai_timeout = 60;            // seconds
  GenerateOptions gen;
  std::uint64_t seed = 0;         // 0: time based
  std::string log_file = "wordtui.log";
  int log_level = 1;
  KeyMap keys;
};

class ConfigLoader {
public:
  explicit ConfigLoader(AppConfig& cfg);

  // Runs one rc line; blank and comment lines succeed without a message.
  bool execute_line(const std::string& line, std::string& msg);
  // Returns false only if the file can not be read; per-line problems are
  // appended to `problems` as "<file>:<line>: <msg>".
  bool load_file(const std::filesystem::path& path, std::vector<std::string>& problems, std::string& msg);

private:
  void register_commands();
  AppConfig& cfg_;
  CommandRegistry registry_;
};

std::optional<std::filesystem::path> find_rc_file(const std::optional<std::filesystem::path>& explicit_path);
bool parse_on_off(const std::string& s, bool& out);
bool parse_int_in(const std::string& s, int min, int max, int& out);
