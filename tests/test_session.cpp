#include "session.hpp"
#include "fakes.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <thread>

struct Harness {
  WordStore words;
  KeyMap keys;
  ThemeRegistry themes;
  FakeGenerator gen;
  MemoryNoteStore notes;
  int saves = 0;
  bool fail_save = false;
  std::unique_ptr<Session> s;

  explicit Harness(std::vector<WordEntry> w, SessionOptions o = SessionOptions{}) {
    words.load(std::move(w));
    if (o.seed == 0) o.seed = 1234;
    s = std::make_unique<Session>(words, keys, themes, gen, notes, o);
    s->set_clock([]() { return std::time_t(1700000000); });
    s->set_save_callback([this](const ProgressMap&, std::string& msg) {
      if (fail_save) { msg = "read-only file system"; return false; }
      saves++;
      return true;
    });
  }
  Frame key(const char* text) { return s->handle(Event::of_char(text)); }
  Frame key(KeyCode c) { return s->handle(Event::of_key(c)); }
  Frame type(const std::string& text) {
    Frame f;
    for (char c : text) f = key(std::string(1, c).c_str());
    return f;
  }
  std::string current_term() const {
    if (auto* l = s->top_as<LearningState>()) return l->order[l->cursor];
    if (auto* sp = s->top_as<SpellingState>()) return sp->order[sp->cursor];
    return std::string();
  }
};

static std::vector<WordEntry> many_words(int n) {
  std::vector<WordEntry> v;
  for (int i = 0; i < n; ++i) v.push_back({"w" + std::to_string(i), "m" + std::to_string(i), std::nullopt, std::nullopt});
  return v;
}

static void learning_scenario() {
  Harness h(two_words());
  assert(h.s->mode() == Mode::Menu);
  h.key("1");
  assert(h.s->mode() == Mode::Learning);
  assert(h.current_term() == "apple");
  h.key(" ");
  h.key("s");
  assert(h.current_term() == "banana");
  h.key("x");
  h.key("s");
  assert(h.current_term() == "apple");
  assert(h.s->status().find("wrapped") != std::string::npos);
  Stats st = h.words.stats();
  assert(st.total == 2 && st.seen == 2 && st.known == 1 && st.unknown == 1 && st.starred == 0);
  assert(h.saves == 2);

  h.key("w");
  assert(h.current_term() == "banana");
}

static void seen_counts_once() {
  Harness h(two_words());
  h.key("1");
  h.key(" ");
  h.key(KeyCode::Enter);
  h.key("x");
  const Progress* p = h.words.progress("apple");
  assert(p->seen == 1);
  assert(p->known == 2 && p->unknown == 1);
  h.key("s");
  h.key("w");
  h.key(" ");
  assert(h.words.progress("apple")->seen == 1);
}

static void reveal_star_and_shuffle() {
  Harness h(many_words(8));
  h.key("1");
  h.key("p");
  assert(h.s->top_as<LearningState>()->reveal);
  h.key("s");
  assert(!h.s->top_as<LearningState>()->reveal);
  h.key("s");
  std::string term = h.current_term();
  h.key(",");
  assert(h.words.progress(term)->starred);
  h.key("r");
  const LearningState* l = h.s->top_as<LearningState>();
  assert(h.current_term() == term);
  auto sorted = l->order;
  std::sort(sorted.begin(), sorted.end());
  auto expect = h.words.terms();
  std::sort(expect.begin(), expect.end());
  assert(sorted == expect);
}

static void mistake_set_learning() {
  Harness h(two_words());
  h.key("2");
  assert(h.s->mode() == Mode::Menu);
  assert(h.s->status().find("empty") != std::string::npos);
  h.key("1");
  h.key("s");
  h.key(",");
  h.key(".");
  assert(h.s->mode() == Mode::Menu);
  h.key("2");
  const LearningState* l = h.s->top_as<LearningState>();
  assert(l && l->scope == LearnScope::MistakesOnly);
  assert((l->order == std::vector<std::string>{"banana"}));
}

static void spelling() {
  Harness h(two_words());
  h.key("4");
  assert(h.s->mode() == Mode::Spelling);
  const SpellingState* sp = h.s->top_as<SpellingState>();
  assert(!sp->hint_on);
  h.key(KeyCode::Down);
  assert(h.current_term() == "banana");
  h.type("banama");
  assert(h.s->top_as<SpellingState>()->input == "banama");
  h.key(KeyCode::Enter);
  sp = h.s->top_as<SpellingState>();
  assert(sp->input.empty());
  assert(!sp->last_correct);
  assert(sp->feedback.rfind("Wrong", 0) == 0);
  assert(h.words.progress("banana")->unknown == 1);
  assert(h.words.progress("banana")->seen == 1);
  assert(h.current_term() == "apple");

  // letters that are commands elsewhere are plain input here
  h.type("qxs");
  assert(h.s->mode() == Mode::Spelling);
  h.key(KeyCode::Backspace);
  h.key(KeyCode::Backspace);
  h.key(KeyCode::Backspace);
  h.type(" APPLE ");
  h.key(KeyCode::Enter);
  sp = h.s->top_as<SpellingState>();
  assert(sp->last_correct);
  assert(h.words.progress("apple")->known == 1);

  // empty submit records nothing
  h.key(KeyCode::Enter);
  assert(h.words.progress("banana")->unknown == 1);
  assert(h.words.progress("banana")->known == 0);

  h.key(KeyCode::F2);
  assert(h.s->top_as<SpellingState>()->hint_on);
  h.key(KeyCode::Escape);
  assert(h.s->mode() == Mode::Menu);
}

static void learning_to_spelling_keeps_cursor() {
  Harness h(many_words(5));
  h.key("1");
  h.key("s");
  h.key("s");
  std::string term = h.current_term();
  h.key("t");
  assert(h.s->mode() == Mode::Spelling);
  assert(h.current_term() == term);
}

static void boss_restores_state() {
  Harness h(two_words());
  h.key("1");
  h.key("s");
  h.key("p");
  Frame f = h.key(KeyCode::Tab);
  assert(h.s->mode() == Mode::Boss);
  assert(f.flush_input);
  assert(!f.border);
  size_t before = h.s->top_as<BossState>()->lines.size();
  h.s->handle(Event::tick());
  h.s->handle(Event::tick());
  assert(h.s->top_as<BossState>()->lines.size() == before + 2);

  std::string theme = h.themes.current().name;
  h.key(KeyCode::F3);
  assert(h.themes.current().name == theme);
  f = h.key("q");
  assert(!f.quit && !h.s->quit_requested());
  h.key("x");
  assert(h.s->mode() == Mode::Boss);

  f = h.key(KeyCode::Tab);
  assert(f.flush_input);
  assert(h.s->mode() == Mode::Learning);
  const LearningState* l = h.s->top_as<LearningState>();
  assert(l->cursor == 1 && l->reveal);
  assert(h.words.progress("banana")->seen == 0);
}

static void boss_quit_when_enabled() {
  SessionOptions o;
  o.boss_quit = true;
  o.boss_style = BossStyle::LsDirectory;
  Harness h(two_words(), o);
  h.key(KeyCode::Tab);
  assert(h.s->top_as<BossState>()->style == BossStyle::LsDirectory);
  Frame f = h.key("q");
  assert(f.quit);
  assert(h.s->quit_requested());
  assert(h.saves == 1);
}

static void boss_key_rebound() {
  Harness h(two_words());
  std::string msg;
  assert(h.keys.bind("global", "f5", "boss", msg));
  assert(h.keys.bind("global", "tab", "none", msg));
  h.key("1");
  h.key(KeyCode::F5);
  assert(h.s->mode() == Mode::Boss);
  h.key(KeyCode::Tab);
  assert(h.s->mode() == Mode::Boss);
  Frame f = h.key(KeyCode::F5);
  assert(f.flush_input);
  assert(h.s->mode() == Mode::Learning);
}

static void theme_cycle() {
  Harness h(two_words());
  std::string start = h.themes.current().name;
  Frame f;
  for (int i = 0; i < 5; ++i) {
    f = h.key(KeyCode::F3);
    if (i < 4) assert(f.theme.name != start);
  }
  assert(f.theme.name == start);
  assert(h.s->status().find("theme") != std::string::npos);
}

static void viewer_scroll_clamped() {
  Harness h(two_words());
  h.s->handle(Event::resize(8, 40));
  h.key("3");
  assert(h.s->mode() == Mode::Viewer);
  const ViewerState* v = h.s->top_as<ViewerState>();
  int page = h.s->page_height();
  int max_scroll = std::max(0, (int)v->lines.size() - page);
  assert(max_scroll > 0);
  h.key(KeyCode::Up);
  assert(h.s->top_as<ViewerState>()->scroll == 0);
  h.key(KeyCode::End);
  assert(h.s->top_as<ViewerState>()->scroll == max_scroll);
  h.key(KeyCode::Down);
  h.key(KeyCode::PageDown);
  assert(h.s->top_as<ViewerState>()->scroll == max_scroll);
  h.key(KeyCode::Home);
  assert(h.s->top_as<ViewerState>()->scroll == 0);
  h.key(KeyCode::PageDown);
  assert(h.s->top_as<ViewerState>()->scroll == std::min(page, max_scroll));

  // a taller screen shrinks the scroll range
  h.s->handle(Event::resize(60, 100));
  assert(h.s->top_as<ViewerState>()->scroll == 0);
  h.key("q");
  assert(h.s->mode() == Mode::Menu);

  h.key("h");
  assert(h.s->mode() == Mode::Viewer);
  assert(h.s->top_as<ViewerState>()->title == "Help");
  h.key(KeyCode::Escape);
  assert(h.s->mode() == Mode::Menu);
}

static void ai_requests() {
  Harness h(two_words());
  h.key("1");
  h.key("a");
  assert(h.s->mode() == Mode::Viewer);
  assert(h.s->depth() == 2);
  assert(h.gen.calls == 1);
  assert(h.notes.note_exists("apple"));
  assert(h.s->top_as<ViewerState>()->text.find("苹果") != std::string::npos);
  h.key("q");
  assert(h.s->mode() == Mode::Learning);

  h.key("a");
  assert(h.gen.calls == 1); // saved note reused
  h.key("q");
  h.key("A");
  assert(h.gen.calls == 2);
  h.key("q");

  h.gen.fail_terms.insert("apple");
  h.gen.fail_kind = GenerationError::AuthFailure;
  h.key("A");
  const ViewerState* v = h.s->top_as<ViewerState>();
  assert(v && v->error);
  assert(v->text == "AuthFailure: fake failure");
  h.key(KeyCode::Escape);
  assert(h.s->mode() == Mode::Learning);
  assert(h.current_term() == "apple");
}

static void batch_from_menu() {
  Harness h(two_words());
  h.key("1");
  h.key("x");
  h.key("s");
  h.key(",");
  h.key(".");
  h.key("5");
  assert(h.s->mode() == Mode::BatchJob);
  int guard = 0;
  while (!h.s->top_as<BatchState>()->job->finished()) {
    h.s->handle(Event::tick());
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    assert(++guard < 5000);
  }
  const BatchNoteJob& job = *h.s->top_as<BatchState>()->job;
  assert(job.completed() == 2);
  assert(h.notes.notes.size() == 2);
  h.key(KeyCode::Enter);
  assert(h.s->mode() == Mode::Menu);

  h.key("5");
  assert(h.s->top_as<BatchState>()->job->total() == 0);
  h.key(KeyCode::Escape);
  assert(h.s->mode() == Mode::Menu);
}

static void batch_paused_under_boss() {
  Harness h(many_words(4));
  for (const auto& t : h.words.terms()) h.words.toggle_star(t);
  h.key("5");
  h.key(KeyCode::Tab);
  for (int i = 0; i < 20; ++i) h.s->handle(Event::tick());
  assert(h.gen.calls == 0);
  h.key(KeyCode::Tab);
  assert(h.s->mode() == Mode::BatchJob);
  h.s->handle(Event::tick());
  assert(h.s->top_as<BatchState>()->job->busy());
  h.key("c");
  h.key(".");
  assert(h.s->mode() == Mode::Menu);
  assert(h.notes.notes.size() == 1);
}

static void quit_confirmation_and_save_failure() {
  Harness h(two_words());
  h.key("q");
  assert(h.s->awaiting_quit_confirmation());
  h.key("n");
  assert(!h.s->quit_requested());
  assert(h.s->mode() == Mode::Menu);

  h.key("1");
  h.fail_save = true;
  h.key(" ");
  assert(h.s->status_is_warning());
  assert(h.s->status().find("read-only") != std::string::npos);
  assert(h.words.progress("apple")->known == 1);

  h.fail_save = false;
  h.key("q");
  Frame f = h.key("y");
  assert(f.quit);
  assert(h.saves == 1);
}

int main() {
  learning_scenario();
  seen_counts_once();
  reveal_star_and_shuffle();
  mistake_set_learning();
  spelling();
  learning_to_spelling_keeps_cursor();
  boss_restores_state();
  boss_quit_when_enabled();
  boss_key_rebound();
  theme_cycle();
  viewer_scroll_clamped();
  ai_requests();
  batch_from_menu();
  batch_paused_under_boss();
  quit_confirmation_and_save_failure();
  return 0;
}
