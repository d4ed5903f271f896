#pragma once
/*
 * Renderer
 *
 * Purpose: draw a Frame through ITerminal (theme, border, lines, refresh).
 * Constraint: no session knowledge; lines are clipped to the screen by
 * display width, centered lines use the display width too.
 */
#include <string>
#include "frame.hpp"
#include "iterminal.hpp"

class Renderer {
public:
  void render(ITerminal& term, const Frame& frame);
private:
  std::string applied_theme_;
};
