#include "session.hpp"
#include "logging.hpp"
#include "rng.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <cstdio>

static constexpr size_t kBossMaxLines = 200;

Session::Session(WordStore& words, const KeyMap& keys, ThemeRegistry& themes,
                 const INoteGenerator& gen, INoteStore& notes, SessionOptions opts)
  : words_(words), keys_(keys), themes_(themes), gen_(gen), notes_(notes),
    gen_opts_(opts.gen), boss_style_(opts.boss_style), boss_quit_(opts.boss_quit),
    rng_(opts.seed != 0 ? opts.seed : static_cast<std::uint64_t>(std::time(nullptr))),
    rows_(opts.rows), cols_(opts.cols),
    clock_([]() { return std::time(nullptr); }) {
  stack_.reserve(8);
  stack_.emplace_back(MenuState{});
}

Session::~Session() {
  for (auto& m : stack_) {
    if (auto* b = std::get_if<BatchState>(&m)) finish_batch(*b);
  }
}

int Session::page_height() const { return std::max(1, rows_ - 5); }
int Session::text_width() const { return std::max(10, cols_ - 4); }

Frame Session::handle(const Event& ev) {
  switch (ev.kind) {
    case Event::Kind::Resize:
      rows_ = std::max(1, ev.rows);
      cols_ = std::max(1, ev.cols);
      for (auto& m : stack_) {
        if (auto* v = std::get_if<ViewerState>(&m)) rewrap(*v);
      }
      WT_LOGD("SESSION", "resize %dx%d", rows_, cols_);
      break;
    case Event::Kind::Tick:
      on_tick();
      break;
    case Event::Kind::Key:
      on_key(ev.key);
      break;
  }
  Frame f = render();
  f.flush_input = flush_input_;
  flush_input_ = false;
  return f;
}

void Session::on_tick() {
  if (auto* boss = std::get_if<BossState>(&stack_.back())) {
    boss->tick++;
    boss->lines.push_back(boss_next_line(boss->style, boss->tick, clock_(), rng_));
    while (boss->lines.size() > kBossMaxLines) boss->lines.pop_front();
    return;
  }
  if (auto* batch = std::get_if<BatchState>(&stack_.back())) {
    if (batch->job) batch->job->pump(false);
  }
}

void Session::on_key(const Key& key) {
  if (quit_) return;
  if (confirm_quit_) {
    confirm_quit_ = false;
    if (key.code == KeyCode::Char && (key.text == "y" || key.text == "Y")) request_quit();
    else set_status("quit cancelled");
    return;
  }
  if (auto* boss = std::get_if<BossState>(&stack_.back())) {
    on_key(*boss, key);
    return;
  }
  // Spelling owns every character key.
  bool text_key = key.code == KeyCode::Char && std::holds_alternative<SpellingState>(stack_.back());
  if (!text_key) {
    Action g = keys_.lookup(KeyContext::Global, key);
    if (g == Action::ToggleBoss) { enter_boss(); return; }
    if (g == Action::CycleTheme) {
      const Theme& t = themes_.cycle();
      set_status("theme: " + t.name);
      return;
    }
  }
  std::visit([this, &key](auto& s) { on_key(s, key); }, stack_.back());
}

// ---- menu ----

void Session::on_key(MenuState&, const Key& key) {
  switch (keys_.lookup(KeyContext::Menu, key)) {
    case Action::LearnAll: {
      LearningState l;
      l.order = words_.terms();
      set_root(std::move(l));
      set_status("");
      break;
    }
    case Action::LearnMistakes: {
      auto ms = words_.mistake_set();
      if (ms.empty()) { set_status("mistake set is empty: mark words unknown or star them first"); break; }
      LearningState l;
      l.scope = LearnScope::MistakesOnly;
      l.order = std::move(ms);
      set_root(std::move(l));
      set_status("");
      break;
    }
    case Action::ShowStats:
      open_viewer("Statistics", stats_text(), false);
      break;
    case Action::EnterSpelling: {
      SpellingState sp;
      sp.order = words_.terms();
      set_root(std::move(sp));
      set_status("");
      break;
    }
    case Action::StartBatch:
      start_batch();
      break;
    case Action::Help:
      open_viewer("Help", help_text(), false);
      break;
    case Action::QuitApp:
      confirm_quit_ = true;
      break;
    default:
      break;
  }
}

// ---- learning ----

void Session::on_key(LearningState& s, const Key& key) {
  Action a = keys_.lookup(KeyContext::Learning, key);
  switch (a) {
    case Action::Back: back_to_menu(); return;
    case Action::QuitApp: confirm_quit_ = true; return;
    case Action::Help: open_viewer("Help", help_text(), false); return;
    default: break;
  }
  if (s.order.empty()) return;
  const std::string term = s.order[s.cursor];
  switch (a) {
    case Action::Next:
      s.reveal = false;
      if (s.cursor + 1 >= s.order.size()) { s.cursor = 0; set_status("wrapped to the first word"); }
      else { s.cursor++; set_status(""); }
      break;
    case Action::Prev:
      s.reveal = false;
      if (s.cursor == 0) { s.cursor = s.order.size() - 1; set_status("wrapped to the last word"); }
      else { s.cursor--; set_status(""); }
      break;
    case Action::Reveal:
      s.reveal = !s.reveal;
      break;
    case Action::MarkKnown:
      judge(term, Judgment::Known);
      break;
    case Action::MarkUnknown:
      judge(term, Judgment::Unknown);
      break;
    case Action::ToggleStar:
      if (words_.toggle_star(term)) {
        const Progress* p = words_.progress(term);
        set_status(p && p->starred ? "starred: " + term : "unstarred: " + term);
        save_progress();
      }
      break;
    case Action::Shuffle:
      shuffle_in_place(s.order, rng_);
      s.cursor = static_cast<size_t>(std::find(s.order.begin(), s.order.end(), term) - s.order.begin());
      set_status("shuffled");
      break;
    case Action::EnterSpelling: {
      SpellingState sp;
      sp.order = s.order;
      sp.cursor = s.cursor;
      set_root(std::move(sp));
      set_status("");
      return;
    }
    case Action::RequestAi:
      request_ai(term, false);
      return;
    case Action::RegenerateAi:
      request_ai(term, true);
      return;
    default:
      break;
  }
}

// ---- spelling ----

void Session::on_key(SpellingState& s, const Key& key) {
  if (key.code == KeyCode::Char) {
    if (!key.text.empty() && static_cast<unsigned char>(key.text[0]) >= 0x20 && key.text[0] != 0x7f) {
      s.input += key.text;
    }
    return;
  }
  Action a = keys_.lookup(KeyContext::Spelling, key);
  if (a == Action::Back) { back_to_menu(); return; }
  if (s.order.empty()) return;
  auto move = [&s](bool forward) {
    if (forward) s.cursor = (s.cursor + 1) % s.order.size();
    else s.cursor = s.cursor == 0 ? s.order.size() - 1 : s.cursor - 1;
  };
  switch (a) {
    case Action::Submit: {
      if (trim(s.input).empty()) { set_status("type the word first"); break; }
      const std::string term = s.order[s.cursor];
      bool correct = ascii_lower(trim(s.input)) == ascii_lower(trim(term));
      s.last_correct = correct;
      s.feedback = correct ? "Correct: " + term
                           : "Wrong: '" + trim(s.input) + "', answer: " + term;
      s.input.clear();
      judge(term, correct ? Judgment::Known : Judgment::Unknown);
      move(true);
      break;
    }
    case Action::DeleteChar:
      pop_utf8(s.input);
      break;
    case Action::ToggleHint:
      s.hint_on = !s.hint_on;
      set_status(s.hint_on ? "hint on" : "hint off");
      break;
    case Action::Next:
    case Action::Prev:
      move(a == Action::Next);
      s.input.clear();
      s.feedback.clear();
      break;
    default:
      break;
  }
}

// ---- boss ----

void Session::enter_boss() {
  BossState b;
  b.style = boss_style_;
  for (auto& l : boss_initial_lines(boss_style_, clock_(), std::max(1, rows_ - 1), rng_)) b.lines.push_back(std::move(l));
  push(std::move(b));
  flush_input_ = true;
  WT_LOGD("SESSION", "boss on");
}

void Session::on_key(BossState&, const Key& key) {
  // The global boss key closes the screen it opened, wherever it is bound.
  Action a = keys_.lookup(KeyContext::Boss, key);
  if (a == Action::ToggleBoss || keys_.lookup(KeyContext::Global, key) == Action::ToggleBoss) {
    pop();
    flush_input_ = true;
    WT_LOGD("SESSION", "boss off");
  } else if (a == Action::BossQuit && boss_quit_) {
    request_quit();
  }
}

// ---- viewer ----

void Session::on_key(ViewerState& s, const Key& key) {
  int page = page_height();
  int max_scroll = std::max(0, static_cast<int>(s.lines.size()) - page);
  switch (keys_.lookup(KeyContext::Viewer, key)) {
    case Action::ScrollUp: s.scroll--; break;
    case Action::ScrollDown: s.scroll++; break;
    case Action::PageUp: s.scroll -= page; break;
    case Action::PageDown: s.scroll += page; break;
    case Action::Top: s.scroll = 0; break;
    case Action::Bottom: s.scroll = max_scroll; break;
    case Action::Back: pop(); return;
    default: return;
  }
  s.scroll = std::clamp(s.scroll, 0, max_scroll);
}

void Session::open_viewer(const std::string& title, const std::string& text, bool error) {
  ViewerState v;
  v.title = title;
  v.text = text;
  v.error = error;
  rewrap(v);
  push(std::move(v));
}

void Session::rewrap(ViewerState& v) const {
  v.lines = wrap_lines(v.text, text_width());
  int max_scroll = std::max(0, static_cast<int>(v.lines.size()) - page_height());
  v.scroll = std::clamp(v.scroll, 0, max_scroll);
}

// ---- batch ----

void Session::start_batch() {
  BatchState b;
  b.job = std::make_unique<BatchNoteJob>(BatchNoteJob::collect_pending(words_, notes_),
                                          words_, gen_, notes_, gen_opts_);
  set_root(std::move(b));
  set_status("");
}

void Session::finish_batch(BatchState& s) {
  if (!s.job) return;
  s.job->cancel();
  while (s.job->busy()) s.job->pump(true);
}

void Session::on_key(BatchState& s, const Key& key) {
  switch (keys_.lookup(KeyContext::Batch, key)) {
    case Action::Cancel:
      if (!s.job || s.job->finished()) { back_to_menu(); return; }
      s.job->cancel();
      set_status("cancelling after the current word");
      break;
    case Action::Back:
      back_to_menu();
      return;
    default:
      break;
  }
}

// ---- shared operations ----

void Session::set_root(ModeState s) {
  for (auto& m : stack_) {
    if (auto* b = std::get_if<BatchState>(&m)) finish_batch(*b);
  }
  stack_.clear();
  stack_.push_back(std::move(s));
  WT_LOGD("SESSION", "root mode %zu", stack_.back().index());
}

void Session::push(ModeState s) { stack_.push_back(std::move(s)); }

void Session::pop() {
  if (stack_.size() > 1) stack_.pop_back();
  else back_to_menu();
}

void Session::back_to_menu() {
  set_root(MenuState{});
  set_status("");
}

void Session::judge(const std::string& term, Judgment j) {
  bool first = visited_.insert(term).second;
  if (!words_.record_judgment(term, j, first)) return;
  set_status(std::string(j == Judgment::Known ? "known: " : "unknown: ") + term);
  save_progress();
}

void Session::request_ai(const std::string& term, bool regenerate) {
  const WordEntry* e = words_.find(term);
  if (!e) return;
  std::string text, msg;
  if (!regenerate && notes_.note_exists(term)) {
    if (notes_.load_note(term, text, msg)) {
      open_viewer("AI note: " + term, text, false);
      set_status("saved note (A regenerates)");
      return;
    }
    WT_LOGW("SESSION", "can not load note for '%s': %s", term.c_str(), msg.c_str());
  }
  WT_LOGI("SESSION", "generating note for '%s'", term.c_str());
  Generation g = gen_.explain(*e, gen_opts_);
  if (!g.ok) {
    WT_LOGW("SESSION", "note for '%s' failed: %s", term.c_str(), describe_failure(g).c_str());
    open_viewer("AI request failed: " + term, describe_failure(g), true);
    return;
  }
  if (notes_.save_note(term, g.text, msg)) set_status("note saved");
  else set_status("warning: note not saved: " + msg, true);
  open_viewer("AI note: " + term, g.text, false);
}

void Session::save_progress() {
  if (!save_) return;
  std::string msg;
  if (!save_(words_.progress_map(), msg)) {
    set_status("warning: progress not saved: " + msg, true);
    WT_LOGW("SESSION", "progress not saved: %s", msg.c_str());
  }
}

void Session::request_quit() {
  shutdown();
  quit_ = true;
}

void Session::shutdown() {
  for (auto& m : stack_) {
    if (auto* b = std::get_if<BatchState>(&m)) finish_batch(*b);
  }
  save_progress();
}

// ---- texts ----

std::string Session::stats_text() const {
  Stats s = words_.stats();
  std::string out;
  out += "Total words:   " + std::to_string(s.total) + "\n";
  out += "Seen:          " + std::to_string(s.seen) + "\n";
  out += "Known:         " + std::to_string(s.known) + "\n";
  out += "Need review:   " + std::to_string(s.unknown) + "\n";
  out += "Starred:       " + std::to_string(s.starred) + "\n";
  out += "Mistake set:   " + std::to_string(words_.mistake_set().size()) + "\n";
  return out;
}

std::string Session::help_text() {
  return
    "Menu\n"
    "  1 learn all    2 learn mistake set    3 statistics\n"
    "  4 spelling     5 AI notes for mistake set\n"
    "  h help         q / 6 quit\n"
    "\n"
    "Learning\n"
    "  s / w            next / previous word\n"
    "  p                show or hide the meaning\n"
    "  Space / Enter    I know it\n"
    "  x                I don't know it\n"
    "  ,                star (adds to the mistake set)\n"
    "  r                shuffle    t  spelling\n"
    "  a                AI note (saved one if present)\n"
    "  A                regenerate the AI note\n"
    "  . / Esc          back to menu\n"
    "\n"
    "Spelling (meaning -> word)\n"
    "  every letter is input; Enter checks, Backspace deletes\n"
    "  F2 toggles the hint, Up / Down change word, Esc leaves\n"
    "\n"
    "Viewer\n"
    "  Up / Down, PageUp / PageDown, Home / End scroll; q / Esc closes\n"
    "\n"
    "Anywhere\n"
    "  Tab   boss screen (Tab again restores)\n"
    "  F3    next color theme\n";
}

std::string Session::spelling_hint(const WordEntry& e) {
  auto chars = utf8_chars(e.term);
  std::string h;
  if (chars.size() <= 2) {
    for (const auto& c : chars) h += c;
  } else {
    h = chars.front();
    for (size_t i = 1; i + 1 < chars.size(); ++i) h += " _";
    h += " " + chars.back();
  }
  h += "  (" + std::to_string(chars.size()) + " letters)";
  if (e.phonetic) h += "  " + *e.phonetic;
  return h;
}

// ---- rendering ----

void Session::add_line(Frame& f, int row, const std::string& text, Slot slot, bool centered, int col) const {
  if (row < 0 || row >= rows_) return;
  FrameLine l;
  l.row = row;
  l.col = col;
  l.text = text;
  l.slot = slot;
  l.centered = centered;
  f.lines.push_back(std::move(l));
}

void Session::add_status(Frame& f, const std::string& hint) const {
  add_line(f, rows_ - 3, hint, Slot::Body);
  if (!status_.empty()) add_line(f, rows_ - 2, status_, status_warn_ ? Slot::Warn : Slot::Meaning);
}

Frame Session::render() const {
  Frame f;
  f.mode = mode();
  f.theme = themes_.current();
  f.quit = quit_;
  std::visit([this, &f](const auto& s) { render(s, f); }, stack_.back());
  if (confirm_quit_) add_line(f, rows_ / 2, "  Quit wordtui? (y/n)  ", Slot::Warn);
  return f;
}

void Session::render(const MenuState&, Frame& f) const {
  add_line(f, 2, "=== wordtui ===", Slot::Title);
  static const char* const items[] = {
    "1. Learn all words",
    "2. Learn the mistake set",
    "3. Statistics",
    "4. Spelling (meaning -> word)",
    "5. AI notes for the mistake set",
    "6. Quit",
  };
  int row = 5;
  for (const char* item : items) add_line(f, row++, item, Slot::Body);
  Stats st = words_.stats();
  add_line(f, row + 1, std::to_string(st.total) + " words, " +
           std::to_string(words_.mistake_set().size()) + " in the mistake set", Slot::Phonetic);
  add_line(f, rows_ - 4, "Choose 1-6", Slot::Body);
  add_status(f, "h=help  Tab=boss  F3=theme  q=quit");
}

void Session::render(const LearningState& s, Frame& f) const {
  add_line(f, 1, s.scope == LearnScope::All ? "=== Learning ===" : "=== Mistake set ===", Slot::Title);
  if (s.order.empty()) {
    add_line(f, rows_ / 2, "no words to learn", Slot::Warn);
    add_status(f, ".=menu");
    return;
  }
  const std::string& term = s.order[s.cursor];
  const WordEntry* e = words_.find(term);
  const Progress* p = words_.progress(term);
  std::string pos = "Word " + std::to_string(s.cursor + 1) + "/" + std::to_string(s.order.size());
  if (p && p->starred) pos += " [*]";
  add_line(f, 1, pos, Slot::Body, false, 2);
  add_line(f, 4, term, Slot::Word);
  int row = 6;
  if (e && s.reveal) {
    if (e->phonetic) add_line(f, row++, *e->phonetic, Slot::Phonetic);
    add_line(f, row, e->meaning, Slot::Meaning);
    row += 2;
    if (e->example) {
      for (const auto& l : wrap_text(*e->example, text_width())) {
        if (row >= rows_ - 8) break;
        add_line(f, row++, l, Slot::Body);
      }
    }
  } else {
    add_line(f, row, "[p] show meaning", Slot::Body);
  }
  if (p && (p->seen || p->known || p->unknown)) {
    add_line(f, rows_ - 7, "seen " + std::to_string(p->seen) + " | known " + std::to_string(p->known) +
             " | unknown " + std::to_string(p->unknown), Slot::Body);
  }
  add_line(f, rows_ - 5, "s/w=next/prev  p=meaning  r=shuffle  t=spelling  a/A=AI note", Slot::Body);
  add_line(f, rows_ - 4, "Space/Enter=known  x=unknown  ,=star", Slot::Body);
  add_status(f, "h=help  Tab=boss  .=menu  q=quit");
}

void Session::render(const SpellingState& s, Frame& f) const {
  add_line(f, 1, "=== Spelling (meaning -> word) ===", Slot::Title);
  if (s.order.empty()) {
    add_line(f, rows_ / 2, "no words to spell", Slot::Warn);
    add_status(f, "Esc=menu");
    return;
  }
  add_line(f, 1, "Word " + std::to_string(s.cursor + 1) + "/" + std::to_string(s.order.size()), Slot::Body, false, 2);
  const WordEntry* e = words_.find(s.order[s.cursor]);
  int row = 4;
  if (e) add_line(f, row, e->meaning, Slot::Meaning);
  row += 2;
  if (e && s.hint_on) {
    add_line(f, row, "Hint: " + spelling_hint(*e), Slot::Phonetic);
    row += 2;
  }
  add_line(f, row++, "Type the word:", Slot::Body);
  add_line(f, row, s.input + "_", Slot::Word);
  row += 2;
  if (!s.feedback.empty()) add_line(f, row, s.feedback, s.last_correct ? Slot::Meaning : Slot::Warn);
  add_line(f, rows_ - 5, "Enter=check  Backspace=delete  F2=hint", Slot::Body);
  add_line(f, rows_ - 4, "Up/Down=previous/next word", Slot::Body);
  add_status(f, "Esc=menu  Tab=boss");
}

static Slot slot_for_tone(BossLine::Tone t) {
  switch (t) {
    case BossLine::Tone::Info: return Slot::Meaning;
    case BossLine::Tone::Debug: return Slot::Phonetic;
    case BossLine::Tone::Warn: return Slot::Warn;
    case BossLine::Tone::Dir: return Slot::Title;
    case BossLine::Tone::Exec: return Slot::Word;
    case BossLine::Tone::Plain: break;
  }
  return Slot::Body;
}

void Session::render(const BossState& s, Frame& f) const {
  f.border = false;
  add_line(f, 0, "$ " + boss_title(s.style), Slot::Body, false, 0);
  int visible = std::max(0, rows_ - 1);
  size_t first = s.lines.size() > static_cast<size_t>(visible) ? s.lines.size() - visible : 0;
  int row = 1;
  for (size_t i = first; i < s.lines.size(); ++i) {
    add_line(f, row++, s.lines[i].text, slot_for_tone(s.lines[i].tone), false, 0);
  }
}

void Session::render(const ViewerState& s, Frame& f) const {
  add_line(f, 1, s.title, s.error ? Slot::Warn : Slot::Title);
  int page = page_height();
  int row = 2;
  for (int i = s.scroll; i < static_cast<int>(s.lines.size()) && i < s.scroll + page; ++i) {
    add_line(f, row++, s.lines[i], s.error ? Slot::Warn : Slot::Body, false, 2);
  }
  std::string where;
  if (static_cast<int>(s.lines.size()) > page) {
    where = "  lines " + std::to_string(s.scroll + 1) + "-" +
            std::to_string(std::min(static_cast<int>(s.lines.size()), s.scroll + page)) +
            "/" + std::to_string(s.lines.size());
  }
  add_status(f, "Up/Down/PgUp/PgDn=scroll  q/Esc=close" + where);
}

void Session::render(const BatchState& s, Frame& f) const {
  add_line(f, 1, "=== AI notes for the mistake set ===", Slot::Title);
  if (!s.job) return;
  const BatchNoteJob& job = *s.job;
  int bar_width = std::max(10, std::min(40, cols_ - 30));
  int filled = static_cast<int>(job.fraction() * bar_width + 0.5);
  std::string bar = "[" + std::string(filled, '#') + std::string(bar_width - filled, '.') + "]";
  char pct[16];
  std::snprintf(pct, sizeof(pct), " %3d%%", static_cast<int>(job.fraction() * 100 + 0.5));
  add_line(f, 3, bar + pct, Slot::Meaning);
  add_line(f, 4, "ok " + std::to_string(job.completed()) + "  failed " + std::to_string(job.failed()) +
           "  left " + std::to_string(job.remaining()) + "  of " + std::to_string(job.total()), Slot::Body);
  std::string state;
  if (job.busy()) state = "working on: " + job.current_term();
  else if (job.finished()) state = job.cancelled() ? "cancelled" : "finished";
  else state = "starting...";
  add_line(f, 5, state, job.busy() ? Slot::Word : Slot::Phonetic);
  int first_row = 7;
  int room = std::max(0, rows_ - 4 - first_row);
  const auto& log = job.log();
  size_t first = log.size() > static_cast<size_t>(room) ? log.size() - room : 0;
  int row = first_row;
  for (size_t i = first; i < log.size(); ++i) {
    Slot slot = log[i].rfind("[fail]", 0) == 0 ? Slot::Warn : Slot::Body;
    add_line(f, row++, log[i], slot, false, 2);
  }
  add_status(f, job.finished() ? "Enter/Esc/q=back to menu" : "c/Esc=cancel  .=stop and leave  Tab=boss");
}
