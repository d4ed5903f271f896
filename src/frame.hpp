#pragma once
/*
 * Frame
 *
 * Purpose: everything one redraw needs, produced by Session::handle().
 * Positions are absolute screen cells; `centered` lines ignore `col` and are
 * centered by display width. The renderer clips, it never wraps.
 */
#include <string>
#include <vector>
#include "theme_registry.hpp"
#include "types.hpp"

struct FrameLine {
  int row = 0;
  int col = 0;
  std::string text;
  Slot slot = Slot::Body;
  bool centered = false;
};

struct Frame {
  Mode mode = Mode::Menu;
  Theme theme;
  bool border = true;
  std::vector<FrameLine> lines;
  bool flush_input = false; // drop keys typed ahead (boss toggle)
  bool quit = false;        // host loop stops after this frame
};
