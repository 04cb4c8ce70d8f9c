#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; call close() on the clean path so teardown errors
 * surface; the destructor restores the terminal on every other path.
 * Note: manages terminal modes (alt screen/raw/noecho/keypad/mouse), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
  // throws std::runtime_error if the terminal could not be restored
  void close();
private:
  bool restore();
  SCREEN* screen_ = nullptr;
  bool active_ = false;
};
