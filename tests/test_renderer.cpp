#include "app.hpp"
#include "fakes.hpp"
#include "headless_terminal.hpp"
#include "renderer.hpp"
#include "text_util.hpp"
#include <cassert>

struct Screen {
  WordStore words;
  KeyMap keys;
  ThemeRegistry themes;
  FakeGenerator gen;
  MemoryNoteStore notes;
  HeadlessTerminal term;
  Renderer renderer;
  std::unique_ptr<Session> s;

  Screen(int rows, int cols) : term(rows, cols) {
    words.load(two_words());
    SessionOptions o;
    o.seed = 5;
    o.rows = rows;
    o.cols = cols;
    s = std::make_unique<Session>(words, keys, themes, gen, notes, o);
  }
  void draw(const Event& ev) { renderer.render(term, s->handle(ev)); }
  void press(const char* text) { draw(Event::of_char(text)); }
  void press(KeyCode c) { draw(Event::of_key(c)); }
};

static void menu_and_learning() {
  Screen sc(24, 80);
  sc.draw(Event::resize(24, 80));
  assert(sc.term.themes_applied() == 1);
  assert(sc.term.theme() == "classic");
  int row = sc.term.find_row("=== wordtui ===");
  assert(row == 2);
  std::string line = sc.term.row_text(row);
  int col = (int)line.find("===");
  assert(col == (80 - display_width("=== wordtui ===")) / 2);
  assert(sc.term.pair_at(row, col) == color_pair_for(Slot::Title));
  assert(sc.term.row_text(0).rfind("+---", 0) == 0);

  sc.press("1");
  assert(sc.term.contains("apple"));
  assert(!sc.term.contains("苹果"));
  sc.press("p");
  int mrow = sc.term.find_row("苹果");
  assert(mrow > 0);
  std::string mline = sc.term.row_text(mrow);
  assert(sc.term.pair_at(mrow, (int)mline.find_first_not_of(" |")) == color_pair_for(Slot::Meaning));

  sc.press(KeyCode::F3);
  assert(sc.term.theme() == "ocean");
  assert(sc.term.themes_applied() == 2);
  sc.press("s");
  assert(sc.term.themes_applied() == 2);
}

static void boss_screen() {
  Screen sc(10, 60);
  sc.draw(Event::resize(10, 60));
  sc.press(KeyCode::Tab);
  assert(sc.term.row_text(0).rfind("$ tail -f", 0) == 0);
  assert(sc.term.row_text(9).rfind("[", 0) == 0);
  assert(!sc.term.contains("wordtui"));
}

static void narrow_screen_clips() {
  Screen sc(24, 12);
  sc.draw(Event::resize(24, 12));
  sc.press("1");
  sc.press("p");
  for (int r = 0; r < 24; ++r) assert(display_width(sc.term.row_text(r)) <= 12);
}

static void host_loop() {
  Screen sc(24, 80);
  App app(sc.term, *sc.s, 1000);
  sc.term.push_event(Event::of_char("1"));
  sc.term.push_event(Event::of_char(" "));
  sc.term.push_event(Event::of_key(KeyCode::Tab));
  sc.term.push_event(Event::of_char("x")); // typed ahead of the boss screen, dropped
  assert(app.run(4) == 0);
  assert(sc.term.flushes() == 1);
  assert(sc.term.pending_events() == 0);
  assert(sc.s->mode() == Mode::Boss);
  assert(sc.words.progress("apple")->known == 1);
  assert(sc.words.progress("apple")->unknown == 0);

  sc.term.push_event(Event::of_key(KeyCode::Tab));
  assert(app.run(1) == 0);
  assert(sc.s->mode() == Mode::Learning);
  assert(sc.term.flushes() == 2);
  sc.term.push_event(Event::of_char("q"));
  sc.term.push_event(Event::of_char("y"));
  assert(app.run(100) == 0);
  assert(sc.s->quit_requested());
}

int main() {
  menu_and_learning();
  boss_screen();
  narrow_screen_clips();
  host_loop();
  return 0;
}
