#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before NcursesTerminal; destructor restores the terminal.
 * Note: raw mode keeps Ctrl-C and Ctrl-Z as plain keys; Esc is reported
 * after 25ms so the Esc binding stays responsive.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
