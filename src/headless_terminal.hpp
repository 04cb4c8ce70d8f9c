#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records every drawn cell with its color pair; read_key() replays a scripted
 * key queue and reports a timeout once the queue is empty.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void draw_box(const Rect& area, const std::string& title) override;
  void refresh() override;
  int read_key(int timeout_ms) override;

  void push_key(int ch) { keys_.push_back(ch); }
  void push_keys(const std::string& s) { for (char c : s) keys_.push_back(static_cast<unsigned char>(c)); }
  void fail_refresh(bool on) { fail_refresh_ = on; }

  char cell(int row, int col) const;
  int color_at(int row, int col) const;
  std::string row_text(int row) const;
  // first screen row containing `needle`, or -1
  int find_row(const std::string& needle) const;
  int refresh_count() const { return refreshes_; }
  int poll_count() const { return polls_; }
  int last_timeout() const { return last_timeout_; }
private:
  void put(int row, int col, const std::string& text, int color_pair_id);

  int rows_;
  int cols_;
  std::vector<std::string> chars_;
  std::vector<std::vector<int>> colors_;
  std::deque<int> keys_;
  bool fail_refresh_ = false;
  int refreshes_ = 0;
  int polls_ = 0;
  int last_timeout_ = -1;
};
