#pragma once
/*
 * Session
 *
 * Purpose: the mode state machine. Consumes Events (key, tick, resize),
 * mutates WordStore through its operations and returns the Frame to draw.
 * Modes: a stack of ModeState. The bottom entry is the root mode (Menu,
 * Learning, Spelling or BatchJob); Viewer and Boss are pushed over it and
 * popped to return, so the state under them is kept untouched.
 * Threading: single threaded; the only worker is inside BatchNoteJob and
 * its results are applied from on_tick().
 */
#include <cstdint>
#include <ctime>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>
#include "batch_note_job.hpp"
#include "boss_overlay.hpp"
#include "frame.hpp"
#include "keymap.hpp"
#include "note_generator.hpp"
#include "theme_registry.hpp"
#include "word_store.hpp"

enum class LearnScope { All, MistakesOnly };

struct MenuState {};

struct LearningState {
  LearnScope scope = LearnScope::All;
  std::vector<std::string> order;
  size_t cursor = 0;
  bool reveal = false;
};

struct SpellingState {
  std::vector<std::string> order;
  size_t cursor = 0;
  std::string input;
  bool hint_on = false;
  std::string feedback;
  bool last_correct = false;
};

struct BossState {
  BossStyle style = BossStyle::TailLog;
  std::deque<BossLine> lines;
  unsigned tick = 0;
};

struct ViewerState {
  std::string title;
  std::string text;               // unwrapped, kept for resize
  std::vector<std::string> lines; // wrapped to the current width
  int scroll = 0;
  bool error = false;
};

struct BatchState {
  std::unique_ptr<BatchNoteJob> job;
};

// Alternative order follows enum class Mode.
using ModeState = std::variant<MenuState, LearningState, SpellingState, BossState, ViewerState, BatchState>;

struct SessionOptions {
  GenerateOptions gen;
  BossStyle boss_style = BossStyle::TailLog;
  bool boss_quit = false;
  std::uint64_t seed = 0;
  int rows = 24;
  int cols = 80;
};

class Session {
public:
  using SaveFn = std::function<bool(const ProgressMap&, std::string&)>;
  using ClockFn = std::function<std::time_t()>;

  Session(WordStore& words, const KeyMap& keys, ThemeRegistry& themes,
          const INoteGenerator& gen, INoteStore& notes, SessionOptions opts);
  ~Session();
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  Frame handle(const Event& ev);
  Frame render() const;

  void set_save_callback(SaveFn fn) { save_ = std::move(fn); }
  void set_clock(ClockFn fn) { clock_ = std::move(fn); }
  void set_status(const std::string& msg, bool warn = false) { status_ = msg; status_warn_ = warn; }
  // Cancels and drains a running batch job, then saves progress.
  void shutdown();

  Mode mode() const { return static_cast<Mode>(stack_.back().index()); }
  size_t depth() const { return stack_.size(); }
  template <typename T> const T* top_as() const { return std::get_if<T>(&stack_.back()); }
  template <typename T> const T* find_state() const {
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
      if (const T* s = std::get_if<T>(&*it)) return s;
    }
    return nullptr;
  }
  bool awaiting_quit_confirmation() const { return confirm_quit_; }
  bool quit_requested() const { return quit_; }
  const std::string& status() const { return status_; }
  bool status_is_warning() const { return status_warn_; }
  int page_height() const;
  int text_width() const;

private:
  void on_tick();
  void on_key(const Key& key);
  void on_key(MenuState& s, const Key& key);
  void on_key(LearningState& s, const Key& key);
  void on_key(SpellingState& s, const Key& key);
  void on_key(BossState& s, const Key& key);
  void on_key(ViewerState& s, const Key& key);
  void on_key(BatchState& s, const Key& key);

  void render(const MenuState& s, Frame& f) const;
  void render(const LearningState& s, Frame& f) const;
  void render(const SpellingState& s, Frame& f) const;
  void render(const BossState& s, Frame& f) const;
  void render(const ViewerState& s, Frame& f) const;
  void render(const BatchState& s, Frame& f) const;

  // Stack changes. Callers must not touch the handled state afterwards.
  void set_root(ModeState s);
  void push(ModeState s);
  void pop();
  void back_to_menu();

  void enter_boss();
  void start_batch();
  void finish_batch(BatchState& s);
  void open_viewer(const std::string& title, const std::string& text, bool error);
  void rewrap(ViewerState& v) const;
  void request_ai(const std::string& term, bool regenerate);
  void judge(const std::string& term, Judgment j);
  void save_progress();
  void request_quit();

  std::string stats_text() const;
  static std::string help_text();
  static std::string spelling_hint(const WordEntry& e);
  void add_line(Frame& f, int row, const std::string& text, Slot slot, bool centered = true, int col = 0) const;
  void add_status(Frame& f, const std::string& hint) const;

  WordStore& words_;
  const KeyMap& keys_;
  ThemeRegistry& themes_;
  const INoteGenerator& gen_;
  INoteStore& notes_;
  GenerateOptions gen_opts_;
  BossStyle boss_style_;
  bool boss_quit_;
  std::uint64_t rng_;
  int rows_;
  int cols_;

  std::vector<ModeState> stack_;
  std::unordered_set<std::string> visited_; // terms judged at least once this run
  std::string status_;
  bool status_warn_ = false;
  bool confirm_quit_ = false;
  bool quit_ = false;
  bool flush_input_ = false;
  SaveFn save_;
  ClockFn clock_;
};
