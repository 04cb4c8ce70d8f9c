#include "headless_terminal.hpp"
#include <stdexcept>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols) {
  clear();
}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  chars_.assign(rows_, std::string(cols_, ' '));
  colors_.assign(rows_, std::vector<int>(cols_, CP_DEFAULT));
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int color_pair_id) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    chars_[row][c] = text[i];
    colors_[row][c] = color_pair_id;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, CP_DEFAULT);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, color_pair_id);
}

void HeadlessTerminal::draw_box(const Rect& area, const std::string& title) {
  if (area.height < 2 || area.width < 2) return;
  int r1 = area.row + area.height - 1;
  int c1 = area.col + area.width - 1;
  std::string edge = "+" + std::string(area.width - 2, '-') + "+";
  put(area.row, area.col, edge, CP_DEFAULT);
  put(r1, area.col, edge, CP_DEFAULT);
  for (int r = area.row + 1; r < r1; ++r) {
    put(r, area.col, "|", CP_DEFAULT);
    put(r, c1, "|", CP_DEFAULT);
  }
  put(area.row, area.col + 1, title.substr(0, area.width - 2), CP_DEFAULT);
}

void HeadlessTerminal::refresh() {
  if (fail_refresh_) throw std::runtime_error("failed to draw frame");
  refreshes_++;
}

int HeadlessTerminal::read_key(int timeout_ms) {
  polls_++;
  last_timeout_ = timeout_ms;
  if (keys_.empty()) return NO_KEY;
  int ch = keys_.front();
  keys_.pop_front();
  return ch;
}

char HeadlessTerminal::cell(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return '\0';
  return chars_[row][col];
}

int HeadlessTerminal::color_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return 0;
  return colors_[row][col];
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  return chars_[row];
}

int HeadlessTerminal::find_row(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) {
    if (chars_[r].find(needle) != std::string::npos) return r;
  }
  return -1;
}
