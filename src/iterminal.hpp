#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, draw, theme, input).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Colors: pair id = slot index + 1 (see theme_registry.hpp).
 */
#include <string>
#include "theme_registry.hpp"
#include "types.hpp"

struct TermSize { int rows; int cols; };

inline int color_pair_for(Slot s) { return static_cast<int>(s) + 1; }

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void draw_border() = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void apply_theme(const Theme& theme) = 0;
  // Waits up to timeout_ms; false on timeout.
  virtual bool read_event(int timeout_ms, Event& out) = 0;
  virtual void flush_input() = 0;
};
