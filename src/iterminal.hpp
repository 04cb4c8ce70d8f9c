#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, boxes, refresh, key polling).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "pane_layout.hpp"

struct TermSize { int rows; int cols; };

// color pair ids shared by every backend
enum ColorPairId {
  CP_DEFAULT = 1,
  CP_CORRECT = 2,
  CP_ERROR = 3,
  CP_UNTYPED = 4,
};

static constexpr int NO_KEY = -1; // read_key timed out

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void draw_box(const Rect& area, const std::string& title) = 0;
  virtual void refresh() = 0;
  // waits up to timeout_ms; returns NO_KEY when nothing arrived
  virtual int read_key(int timeout_ms) = 0;
};
