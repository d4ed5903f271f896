#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests. Keeps a grid of cells (one UTF-8
 * character per cell, wide characters leave an empty continuation cell) with
 * the color pair of each cell, and replays scripted events.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void draw_border() override;
  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;
  void apply_theme(const Theme& theme) override { theme_ = theme.name; themes_applied_++; }
  bool read_event(int timeout_ms, Event& out) override;
  void flush_input() override;

  void push_event(const Event& ev) { events_.push_back(ev); }
  void resize(int rows, int cols);

  // Row text with trailing blanks removed.
  std::string row_text(int row) const;
  int pair_at(int row, int col) const;
  // First row containing `needle`, or -1.
  int find_row(const std::string& needle) const;
  bool contains(const std::string& needle) const { return find_row(needle) >= 0; }

  int refreshes() const { return refreshes_; }
  int flushes() const { return flushes_; }
  int themes_applied() const { return themes_applied_; }
  const std::string& theme() const { return theme_; }
  size_t pending_events() const { return events_.size(); }

private:
  void put(int row, int col, const std::string& text, int pair);

  int rows_;
  int cols_;
  std::vector<std::vector<std::string>> cells_;
  std::vector<std::vector<int>> pairs_;
  std::deque<Event> events_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
  int flushes_ = 0;
  int themes_applied_ = 0;
  std::string theme_;
};
