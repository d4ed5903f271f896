#include "ncurses_terminal.hpp"
#include <climits>
#include <cwchar>

static short curses_color(Color c, bool default_ok) {
  switch (c) {
    case Color::Black: return COLOR_BLACK;
    case Color::Red: return COLOR_RED;
    case Color::Green: return COLOR_GREEN;
    case Color::Yellow: return COLOR_YELLOW;
    case Color::Blue: return COLOR_BLUE;
    case Color::Magenta: return COLOR_MAGENTA;
    case Color::Cyan: return COLOR_CYAN;
    case Color::White: return COLOR_WHITE;
    case Color::Default: break;
  }
  return default_ok ? -1 : COLOR_WHITE;
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    colors_ = true;
    default_colors_ = use_default_colors() == OK;
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  draw_colored(row, col, text, color_pair_for(Slot::Body));
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (colors_) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::draw_border() {
  if (colors_) attron(COLOR_PAIR(color_pair_for(Slot::Body)));
  box(stdscr, 0, 0);
  if (colors_) attroff(COLOR_PAIR(color_pair_for(Slot::Body)));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::apply_theme(const Theme& theme) {
  if (!colors_) return;
  short bg = theme.bg == Color::Default ? (default_colors_ ? -1 : COLOR_BLACK)
                                        : curses_color(theme.bg, default_colors_);
  for (int i = 0; i < kSlotCount; ++i) {
    init_pair(i + 1, curses_color(theme.fg[i], default_colors_), bg);
  }
  init_pair(kSlotCount + 1, default_colors_ ? -1 : COLOR_WHITE, bg);
  wbkgd(stdscr, COLOR_PAIR(kSlotCount + 1));
  erase();
}

static KeyCode map_function_key(wint_t k) {
  switch (k) {
    case KEY_UP: return KeyCode::Up;
    case KEY_DOWN: return KeyCode::Down;
    case KEY_LEFT: return KeyCode::Left;
    case KEY_RIGHT: return KeyCode::Right;
    case KEY_PPAGE: return KeyCode::PageUp;
    case KEY_NPAGE: return KeyCode::PageDown;
    case KEY_HOME: return KeyCode::Home;
    case KEY_END: return KeyCode::End;
    case KEY_ENTER: return KeyCode::Enter;
    case KEY_BACKSPACE: return KeyCode::Backspace;
    default: break;
  }
  for (int n = 1; n <= 12; ++n) {
    if (k == (wint_t)KEY_F(n)) return static_cast<KeyCode>(static_cast<int>(KeyCode::F1) + n - 1);
  }
  return KeyCode::Unknown;
}

bool NcursesTerminal::read_event(int timeout_ms, Event& out) {
  timeout(timeout_ms);
  wint_t ch = 0;
  int rc = get_wch(&ch);
  if (rc == ERR) return false;
  if (rc == KEY_CODE_YES) {
    if (ch == KEY_RESIZE) {
      TermSize sz = getSize();
      out = Event::resize(sz.rows, sz.cols);
      return true;
    }
    out = Event::of_key(map_function_key(ch));
    return true;
  }
  switch (ch) {
    case L'\n': case L'\r': out = Event::of_key(KeyCode::Enter); return true;
    case 27: out = Event::of_key(KeyCode::Escape); return true;
    case L'\t': out = Event::of_key(KeyCode::Tab); return true;
    case 127: case 8: out = Event::of_key(KeyCode::Backspace); return true;
    default: break;
  }
  if (ch < 32) { out = Event::of_key(KeyCode::Unknown); return true; }
  char buf[MB_LEN_MAX];
  std::mbstate_t st{};
  size_t n = std::wcrtomb(buf, static_cast<wchar_t>(ch), &st);
  if (n == static_cast<size_t>(-1)) { out = Event::of_key(KeyCode::Unknown); return true; }
  out = Event::of_char(std::string(buf, n));
  return true;
}

void NcursesTerminal::flush_input() { flushinp(); }
