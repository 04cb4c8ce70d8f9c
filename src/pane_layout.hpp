#pragma once
/*
 * PaneLayout
 *
 * Purpose: rectangle arithmetic for the fixed two-panel screen.
 * Usage: inset() the screen by the margin, then split_horizontal() it.
 */

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct PanelRects {
  Rect top;
  Rect bottom;
};

Rect inset(const Rect& area, int margin);
// stacks two rects; `ratio` is the top share of the height
PanelRects split_horizontal(const Rect& area, float ratio);
PanelRects screen_layout(int rows, int cols, int margin);
