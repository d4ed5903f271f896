#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncursesw for drawing and
 * wide-character input (get_wch).
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 * Colors: pairs 1..kSlotCount follow the active theme; pair kSlotCount+1
 * is the window background.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void draw_border() override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  void apply_theme(const Theme& theme) override;
  bool read_event(int timeout_ms, Event& out) override;
  void flush_input() override;
private:
  bool colors_ = false;
  bool default_colors_ = false;
};
