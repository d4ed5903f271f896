#pragma once
/*
 * KeyMap
 *
 * Purpose: per-context table key -> Action. The session only ever sees
 * actions; every binding can be overridden from the rc file with
 * `bind <context> <key> <action>`.
 * Key ids: a single UTF-8 character ("a", "A", ","), or one of
 * space enter esc tab backspace up down left right pageup pagedown home end f1..f12.
 */
#include <array>
#include <string>
#include <unordered_map>
#include "types.hpp"

enum class KeyContext { Global = 0, Menu, Learning, Spelling, Viewer, Batch, Boss };
constexpr int kKeyContextCount = 7;

enum class Action {
  None,
  QuitApp, Back, Help,
  LearnAll, LearnMistakes, ShowStats, EnterSpelling, StartBatch,
  Next, Prev, Reveal, MarkKnown, MarkUnknown, ToggleStar, Shuffle,
  RequestAi, RegenerateAi,
  ToggleHint, Submit, DeleteChar,
  ScrollUp, ScrollDown, PageUp, PageDown, Top, Bottom,
  Cancel,
  ToggleBoss, CycleTheme, BossQuit
};

class KeyMap {
public:
  KeyMap(); // default bindings

  Action lookup(KeyContext ctx, const Key& key) const;
  void bind(KeyContext ctx, const std::string& key_id, Action a);
  // rc form: names for context/key/action; "none" removes a binding.
  bool bind(const std::string& ctx, const std::string& key, const std::string& action, std::string& msg);

  static std::string key_id(const Key& key);
  static bool parse_key(const std::string& name, std::string& id);
  static bool parse_context(const std::string& name, KeyContext& out);
  static bool parse_action(const std::string& name, Action& out);
  static const char* action_name(Action a);

private:
  std::array<std::unordered_map<std::string, Action>, kKeyContextCount> maps_;
};
