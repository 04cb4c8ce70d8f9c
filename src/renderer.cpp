#include "renderer.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "metrics.hpp"
#include "pane_layout.hpp"

CharState classify_char(const Session& s, size_t i) {
  if (i >= s.typed.size()) return CharState::Untyped;
  if (i < s.sample.size() && s.typed[i] == s.sample[i]) return CharState::Correct;
  return CharState::Error;
}

int color_for(CharState st) {
  switch (st) {
    case CharState::Correct: return CP_CORRECT;
    case CharState::Error: return CP_ERROR;
    case CharState::Untyped: return CP_UNTYPED;
  }
  return CP_DEFAULT;
}

std::string stats_text(const Session& s, TimePoint now) {
  std::ostringstream oss;
  oss << std::fixed;
  if (s.finished) {
    oss << "Finished! WPM: ";
    auto wpm = words_per_minute(s, now);
    if (wpm) oss << std::setprecision(0) << *wpm; else oss << "--";
    oss << " | Accuracy: " << std::setprecision(1) << accuracy(s) << "%";
  } else if (auto secs = elapsed_seconds(s, now)) {
    oss << "Typing... " << std::setprecision(1) << *secs << " seconds";
  } else {
    oss << "Press any key to start typing!";
  }
  return oss.str();
}

void Renderer::render(ITerminal& term, const Session& s, TimePoint now) {
  TermSize sz = term.getSize();
  term.clear();
  PanelRects panels = screen_layout(sz.rows, sz.cols, TT_MARGIN);
  term.draw_box(panels.top, "Type this");
  term.draw_box(panels.bottom, "Stats");
  render_sample(term, s, inset(panels.top, 1));
  render_stats(term, s, now, inset(panels.bottom, 1));
  term.refresh();
}

void Renderer::render_sample(ITerminal& term, const Session& s, const Rect& inner) {
  if (inner.height <= 0 || inner.width <= 0) return;
  size_t n = s.sample.size();
  size_t i = 0;
  // one row at a time, each row cut into runs of equal state
  for (int row = 0; row < inner.height && i < n; ++row) {
    size_t row_end = std::min(n, i + static_cast<size_t>(inner.width));
    int col = inner.col;
    while (i < row_end) {
      CharState st = classify_char(s, i);
      size_t start = i;
      while (i < row_end && classify_char(s, i) == st) i++;
      term.draw_colored(inner.row + row, col, s.sample.substr(start, i - start), color_for(st));
      col += static_cast<int>(i - start);
    }
  }
}

void Renderer::render_stats(ITerminal& term, const Session& s, TimePoint now, const Rect& inner) {
  if (inner.height <= 0 || inner.width <= 0) return;
  std::string line = stats_text(s, now);
  if ((int)line.size() > inner.width) line.resize(inner.width);
  term.draw_text(inner.row, inner.col, line);
}
