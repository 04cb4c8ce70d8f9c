#include "ncurses_terminal.hpp"
#include <algorithm>
#include <stdexcept>

NcursesTerminal::NcursesTerminal() {
  if (!has_colors()) { untyped_attr_ = A_DIM; return; }
  start_color();
  short bg = use_default_colors() == OK ? -1 : COLOR_BLACK; // fallback
  init_pair(CP_DEFAULT, bg == -1 ? -1 : COLOR_WHITE, bg);
  init_pair(CP_CORRECT, COLOR_GREEN, bg);
  init_pair(CP_ERROR, COLOR_RED, bg);
  // dark gray is bright black where the palette has it, dim white otherwise
  if (COLORS >= 16) {
    init_pair(CP_UNTYPED, 8, bg);
  } else {
    init_pair(CP_UNTYPED, COLOR_WHITE, bg);
    untyped_attr_ = A_DIM;
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { ::erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(CP_DEFAULT));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(CP_DEFAULT));
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  attr_t extra = color_pair_id == CP_UNTYPED ? untyped_attr_ : A_NORMAL;
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  attron(extra);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(extra);
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::draw_box(const Rect& area, const std::string& title) {
  if (area.height < 2 || area.width < 2) return;
  int r0 = area.row, c0 = area.col;
  int r1 = area.row + area.height - 1, c1 = area.col + area.width - 1;
  mvhline(r0, c0 + 1, ACS_HLINE, area.width - 2);
  mvhline(r1, c0 + 1, ACS_HLINE, area.width - 2);
  mvvline(r0 + 1, c0, ACS_VLINE, area.height - 2);
  mvvline(r0 + 1, c1, ACS_VLINE, area.height - 2);
  mvaddch(r0, c0, ACS_ULCORNER);
  mvaddch(r0, c1, ACS_URCORNER);
  mvaddch(r1, c0, ACS_LLCORNER);
  mvaddch(r1, c1, ACS_LRCORNER);
  if (!title.empty()) {
    int room = area.width - 2;
    mvaddnstr(r0, c0 + 1, title.c_str(), std::min(room, (int)title.size()));
  }
}

void NcursesTerminal::refresh() {
  if (::refresh() == ERR) throw std::runtime_error("failed to draw frame");
}

int NcursesTerminal::read_key(int timeout_ms) {
  timeout(timeout_ms);
  int ch = getch();
  if (ch == ERR) {
    // ERR inside the window is a timeout; a vanished terminal is not
    if (isendwin()) throw std::runtime_error("failed to read input: terminal closed");
    return NO_KEY;
  }
  return ch;
}
