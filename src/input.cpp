#include "input.hpp"
#include <ncurses.h>

static constexpr int ESC = 27;
static constexpr int CTRL_h = 'H'-64;

bool is_quit_key(int ch) {
  return ch == ESC;
}

bool is_backspace_key(int ch) {
  return ch == KEY_BACKSPACE || ch == 127 || ch == CTRL_h;
}

bool is_printable_key(int ch) {
  return ch >= 32 && ch <= 126;
}

void try_finish(Session& s) {
  if (s.typed.size() >= s.sample.size() && s.typed == s.sample) s.finished = true;
}

void handle_key(Session& s, int ch, TimePoint now) {
  if (is_quit_key(ch)) { s.quit = true; return; }
  if (is_backspace_key(ch)) {
    // allowed after finishing too; `finished` stays set
    if (!s.typed.empty()) s.typed.pop_back();
    return;
  }
  if (!is_printable_key(ch)) return;
  if (s.finished) return;
  if (!s.start_time) s.start_time = now;
  s.typed.push_back(static_cast<char>(ch));
  try_finish(s);
}
