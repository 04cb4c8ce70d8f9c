#include "terminal.hpp"
#include <locale.h>
#include <cstdio>
#include <stdexcept>
#include "config.hpp"

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  // newterm reports failure instead of exiting like initscr does
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw std::runtime_error("failed to initialize terminal");
  set_term(screen_);
  active_ = true;
  if (raw() == ERR || noecho() == ERR || keypad(stdscr, TRUE) == ERR) {
    restore();
    throw std::runtime_error("failed to enter raw mode");
  }
  set_escdelay(TT_ESCDELAY_MS);
  // terminals without mouse or cursor support report 0/ERR here; not fatal
  mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
  curs_set(0);
}

Terminal::~Terminal() {
  restore();
}

void Terminal::close() {
  if (!restore()) throw std::runtime_error("failed to restore terminal");
}

bool Terminal::restore() {
  if (!active_) return true;
  active_ = false;
  mousemask(0, nullptr);
  curs_set(1);
  noraw();
  bool ok = endwin() != ERR;
  delscreen(screen_);
  screen_ = nullptr;
  return ok;
}
