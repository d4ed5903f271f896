#include "terminal.hpp"
#include <clocale>

Terminal::Terminal() {
  // wide-char curses needs the user's locale before initscr
  std::setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  curs_set(0);
  set_escdelay(25);
}

Terminal::~Terminal() {
  curs_set(1);
  endwin();
}
