#include "keymap.hpp"
#include "text_util.hpp"

struct ActionName { Action action; const char* name; };

static const ActionName kActionNames[] = {
  {Action::None, "none"},
  {Action::QuitApp, "quit"},
  {Action::Back, "back"},
  {Action::Help, "help"},
  {Action::LearnAll, "learn_all"},
  {Action::LearnMistakes, "learn_mistakes"},
  {Action::ShowStats, "stats"},
  {Action::EnterSpelling, "spelling"},
  {Action::StartBatch, "batch"},
  {Action::Next, "next"},
  {Action::Prev, "prev"},
  {Action::Reveal, "reveal"},
  {Action::MarkKnown, "known"},
  {Action::MarkUnknown, "unknown"},
  {Action::ToggleStar, "star"},
  {Action::Shuffle, "shuffle"},
  {Action::RequestAi, "ai"},
  {Action::RegenerateAi, "ai_regenerate"},
  {Action::ToggleHint, "hint"},
  {Action::Submit, "submit"},
  {Action::DeleteChar, "delete"},
  {Action::ScrollUp, "scroll_up"},
  {Action::ScrollDown, "scroll_down"},
  {Action::PageUp, "page_up"},
  {Action::PageDown, "page_down"},
  {Action::Top, "top"},
  {Action::Bottom, "bottom"},
  {Action::Cancel, "cancel"},
  {Action::ToggleBoss, "boss"},
  {Action::CycleTheme, "theme"},
  {Action::BossQuit, "boss_quit"},
};

static const char* const kContextNames[kKeyContextCount] = {
  "global", "menu", "learning", "spelling", "viewer", "batch", "boss"
};

struct KeyName { KeyCode code; const char* name; };

static const KeyName kKeyNames[] = {
  {KeyCode::Enter, "enter"}, {KeyCode::Backspace, "backspace"},
  {KeyCode::Escape, "esc"}, {KeyCode::Tab, "tab"},
  {KeyCode::Up, "up"}, {KeyCode::Down, "down"},
  {KeyCode::Left, "left"}, {KeyCode::Right, "right"},
  {KeyCode::PageUp, "pageup"}, {KeyCode::PageDown, "pagedown"},
  {KeyCode::Home, "home"}, {KeyCode::End, "end"},
  {KeyCode::F1, "f1"}, {KeyCode::F2, "f2"}, {KeyCode::F3, "f3"},
  {KeyCode::F4, "f4"}, {KeyCode::F5, "f5"}, {KeyCode::F6, "f6"},
  {KeyCode::F7, "f7"}, {KeyCode::F8, "f8"}, {KeyCode::F9, "f9"},
  {KeyCode::F10, "f10"}, {KeyCode::F11, "f11"}, {KeyCode::F12, "f12"},
};

KeyMap::KeyMap() {
  bind(KeyContext::Global, "tab", Action::ToggleBoss);
  bind(KeyContext::Global, "f3", Action::CycleTheme);

  bind(KeyContext::Menu, "1", Action::LearnAll);
  bind(KeyContext::Menu, "2", Action::LearnMistakes);
  bind(KeyContext::Menu, "3", Action::ShowStats);
  bind(KeyContext::Menu, "4", Action::EnterSpelling);
  bind(KeyContext::Menu, "5", Action::StartBatch);
  bind(KeyContext::Menu, "6", Action::QuitApp);
  bind(KeyContext::Menu, "q", Action::QuitApp);
  bind(KeyContext::Menu, "h", Action::Help);

  bind(KeyContext::Learning, "s", Action::Next);
  bind(KeyContext::Learning, "down", Action::Next);
  bind(KeyContext::Learning, "right", Action::Next);
  bind(KeyContext::Learning, "w", Action::Prev);
  bind(KeyContext::Learning, "up", Action::Prev);
  bind(KeyContext::Learning, "left", Action::Prev);
  bind(KeyContext::Learning, "p", Action::Reveal);
  bind(KeyContext::Learning, " ", Action::MarkKnown);
  bind(KeyContext::Learning, "enter", Action::MarkKnown);
  bind(KeyContext::Learning, "x", Action::MarkUnknown);
  bind(KeyContext::Learning, ",", Action::ToggleStar);
  bind(KeyContext::Learning, "r", Action::Shuffle);
  bind(KeyContext::Learning, "t", Action::EnterSpelling);
  bind(KeyContext::Learning, "a", Action::RequestAi);
  bind(KeyContext::Learning, "A", Action::RegenerateAi);
  bind(KeyContext::Learning, "h", Action::Help);
  bind(KeyContext::Learning, "q", Action::QuitApp);
  bind(KeyContext::Learning, ".", Action::Back);
  bind(KeyContext::Learning, "esc", Action::Back);

  bind(KeyContext::Spelling, "enter", Action::Submit);
  bind(KeyContext::Spelling, "backspace", Action::DeleteChar);
  bind(KeyContext::Spelling, "f2", Action::ToggleHint);
  bind(KeyContext::Spelling, "up", Action::Prev);
  bind(KeyContext::Spelling, "down", Action::Next);
  bind(KeyContext::Spelling, "esc", Action::Back);

  bind(KeyContext::Viewer, "up", Action::ScrollUp);
  bind(KeyContext::Viewer, "k", Action::ScrollUp);
  bind(KeyContext::Viewer, "down", Action::ScrollDown);
  bind(KeyContext::Viewer, "j", Action::ScrollDown);
  bind(KeyContext::Viewer, "pageup", Action::PageUp);
  bind(KeyContext::Viewer, "pagedown", Action::PageDown);
  bind(KeyContext::Viewer, " ", Action::PageDown);
  bind(KeyContext::Viewer, "home", Action::Top);
  bind(KeyContext::Viewer, "end", Action::Bottom);
  bind(KeyContext::Viewer, "q", Action::Back);
  bind(KeyContext::Viewer, "esc", Action::Back);
  bind(KeyContext::Viewer, ".", Action::Back);

  bind(KeyContext::Batch, "c", Action::Cancel);
  bind(KeyContext::Batch, "esc", Action::Cancel);
  bind(KeyContext::Batch, ".", Action::Back);
  bind(KeyContext::Batch, "enter", Action::Back);
  bind(KeyContext::Batch, "q", Action::Back);

  bind(KeyContext::Boss, "q", Action::BossQuit);
  bind(KeyContext::Boss, "Q", Action::BossQuit);
}

Action KeyMap::lookup(KeyContext ctx, const Key& key) const {
  std::string id = key_id(key);
  if (id.empty()) return Action::None;
  const auto& m = maps_[static_cast<int>(ctx)];
  auto it = m.find(id);
  return it == m.end() ? Action::None : it->second;
}

void KeyMap::bind(KeyContext ctx, const std::string& key_id, Action a) {
  auto& m = maps_[static_cast<int>(ctx)];
  if (a == Action::None) m.erase(key_id);
  else m[key_id] = a;
}

bool KeyMap::bind(const std::string& ctx, const std::string& key, const std::string& action, std::string& msg) {
  KeyContext c;
  if (!parse_context(ctx, c)) { msg = "bind: unknown context: " + ctx; return false; }
  std::string id;
  if (!parse_key(key, id)) { msg = "bind: unknown key: " + key; return false; }
  Action a;
  if (!parse_action(action, a)) { msg = "bind: unknown action: " + action; return false; }
  bind(c, id, a);
  msg = "bind " + ctx + " " + key + " " + action;
  return true;
}

std::string KeyMap::key_id(const Key& key) {
  if (key.code == KeyCode::Char) return key.text;
  for (const auto& k : kKeyNames) {
    if (k.code == key.code) return k.name;
  }
  return std::string();
}

bool KeyMap::parse_key(const std::string& name, std::string& id) {
  if (name.empty()) return false;
  if (utf8_length(name) == 1) { id = name; return true; }
  std::string n = ascii_lower(name);
  if (n == "space") { id = " "; return true; }
  if (n == "escape") { id = "esc"; return true; }
  if (n == "return") { id = "enter"; return true; }
  for (const auto& k : kKeyNames) {
    if (n == k.name) { id = k.name; return true; }
  }
  return false;
}

bool KeyMap::parse_context(const std::string& name, KeyContext& out) {
  for (int i = 0; i < kKeyContextCount; ++i) {
    if (name == kContextNames[i]) { out = static_cast<KeyContext>(i); return true; }
  }
  return false;
}

bool KeyMap::parse_action(const std::string& name, Action& out) {
  for (const auto& a : kActionNames) {
    if (name == a.name) { out = a.action; return true; }
  }
  return false;
}

const char* KeyMap::action_name(Action a) {
  for (const auto& n : kActionNames) {
    if (n.action == a) return n.name;
  }
  return "none";
}
