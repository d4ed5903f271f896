#include "renderer.hpp"
#include "text_util.hpp"
#include <algorithm>

void Renderer::render(ITerminal& term, const Frame& frame) {
  if (frame.theme.name != applied_theme_) {
    term.apply_theme(frame.theme);
    applied_theme_ = frame.theme.name;
  }
  TermSize sz = term.getSize();
  term.clear();
  if (frame.border) term.draw_border();
  // keep text off the border columns
  int left = frame.border ? 1 : 0;
  int right = frame.border ? sz.cols - 1 : sz.cols;
  for (const auto& l : frame.lines) {
    if (l.row < 0 || l.row >= sz.rows) continue;
    int col = l.col;
    if (l.centered) col = std::max(left, (sz.cols - display_width(l.text)) / 2);
    col = std::max(col, left);
    int room = right - col;
    if (room <= 0) continue;
    term.draw_colored(l.row, col, clip_to_width(l.text, room), color_pair_for(l.slot));
  }
  term.move_cursor(sz.rows - 1, 0);
  term.refresh();
}
