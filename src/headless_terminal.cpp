#include "headless_terminal.hpp"
#include "text_util.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::clear() {
  cells_.assign(rows_, std::vector<std::string>(cols_, " "));
  pairs_.assign(rows_, std::vector<int>(cols_, 0));
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
  events_.push_back(Event::resize(rows, cols));
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int pair) {
  if (row < 0 || row >= rows_) return;
  for (const auto& ch : utf8_chars(text)) {
    int w = display_width(ch);
    if (col < 0) { col += w; continue; }
    if (col + w > cols_) break;
    if (w == 0) continue;
    cells_[row][col] = ch;
    pairs_[row][col] = pair;
    if (w == 2) { cells_[row][col + 1] = ""; pairs_[row][col + 1] = pair; }
    col += w;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, color_pair_for(Slot::Body));
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, color_pair_id);
}

void HeadlessTerminal::draw_border() {
  if (rows_ < 2 || cols_ < 2) return;
  for (int c = 0; c < cols_; ++c) { cells_[0][c] = "-"; cells_[rows_ - 1][c] = "-"; }
  for (int r = 0; r < rows_; ++r) { cells_[r][0] = "|"; cells_[r][cols_ - 1] = "|"; }
  cells_[0][0] = cells_[0][cols_ - 1] = cells_[rows_ - 1][0] = cells_[rows_ - 1][cols_ - 1] = "+";
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) { cells_[row][c] = " "; pairs_[row][c] = 0; }
}

bool HeadlessTerminal::read_event(int, Event& out) {
  if (events_.empty()) return false;
  out = events_.front();
  events_.pop_front();
  return true;
}

void HeadlessTerminal::flush_input() {
  flushes_++;
  while (!events_.empty() && events_.front().kind == Event::Kind::Key) events_.pop_front();
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string out;
  for (const auto& c : cells_[row]) out += c;
  size_t end = out.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : out.substr(0, end + 1);
}

int HeadlessTerminal::pair_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return 0;
  return pairs_[row][col];
}

int HeadlessTerminal::find_row(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) {
    if (row_text(r).find(needle) != std::string::npos) return r;
  }
  return -1;
}
