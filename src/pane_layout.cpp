#include "pane_layout.hpp"
#include <algorithm>

static int clamp_split(int total, float ratio) {
  if (total <= 1) return total;
  int primary = static_cast<int>(total * ratio);
  primary = std::clamp(primary, 1, total - 1);
  return primary;
}

Rect inset(const Rect& area, int margin) {
  Rect r;
  r.row = area.row + margin;
  r.col = area.col + margin;
  r.height = std::max(0, area.height - 2 * margin);
  r.width = std::max(0, area.width - 2 * margin);
  return r;
}

PanelRects split_horizontal(const Rect& area, float ratio) {
  PanelRects out;
  if (area.height <= 0 || area.width <= 0) return out;
  int top_h = clamp_split(area.height, ratio);
  out.top = Rect{area.row, area.col, top_h, area.width};
  out.bottom = Rect{area.row + top_h, area.col, area.height - top_h, area.width};
  return out;
}

PanelRects screen_layout(int rows, int cols, int margin) {
  return split_horizontal(inset(Rect{0, 0, rows, cols}, margin), 0.5f);
}
