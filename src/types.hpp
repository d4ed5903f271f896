#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/WordEntry/Progress/Event).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <optional>
#include <string>
#include <unordered_map>

enum class Mode { Menu, Learning, Spelling, Boss, Viewer, BatchJob };

struct WordEntry {
  std::string term;
  std::string meaning;
  std::optional<std::string> phonetic;
  std::optional<std::string> example;
};

struct Progress {
  unsigned seen = 0;
  unsigned known = 0;
  unsigned unknown = 0;
  bool starred = false;
};

using ProgressMap = std::unordered_map<std::string, Progress>;

struct Stats {
  unsigned total = 0;
  unsigned seen = 0;
  unsigned known = 0;
  unsigned unknown = 0;
  unsigned starred = 0;
};

enum class Judgment { Known, Unknown };

enum class KeyCode {
  Unknown, Char, Enter, Backspace, Escape, Tab,
  Up, Down, Left, Right, PageUp, PageDown, Home, End,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12
};

struct Key {
  KeyCode code = KeyCode::Unknown;
  std::string text; // UTF-8, only for KeyCode::Char
};

struct Event {
  enum class Kind { Key, Tick, Resize };
  Kind kind = Kind::Tick;
  Key key;
  int rows = 0; // Resize only
  int cols = 0;

  static Event tick() { return Event{}; }
  static Event of_key(KeyCode c) { Event e; e.kind = Kind::Key; e.key.code = c; return e; }
  static Event of_char(const std::string& s) { Event e; e.kind = Kind::Key; e.key.code = KeyCode::Char; e.key.text = s; return e; }
  static Event resize(int r, int c) { Event e; e.kind = Kind::Resize; e.rows = r; e.cols = c; return e; }
};
