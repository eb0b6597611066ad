#include "viewport.hpp"
#include <algorithm>

int recompute_top_line(int top_line, const Cursor& cur, int total_lines, int height) {
  height = std::max(1, height);
  if (cur.row < top_line) top_line = cur.row;
  else if (cur.row > top_line + height - 1) top_line = cur.row - height + 1;
  return std::clamp(top_line, 0, std::max(0, total_lines - height));
}

int recompute_left_col(int left_col, const Cursor& cur, int text_width) {
  if (text_width <= 0) return 0;
  if (cur.col < left_col) left_col = cur.col;
  else if (cur.col >= left_col + text_width) left_col = cur.col - text_width + 1;
  return std::max(0, left_col);
}

int gutter_width_for(int total_lines) {
  int digits = 1;
  int total = std::max(1, total_lines);
  while (total >= 10) { total /= 10; digits++; }
  return digits + 1;
}

int text_width(const Viewport& vp) {
  return std::max(0, vp.width - vp.gutter_width);
}

void scroll_to_cursor(Viewport& vp, const Cursor& cur, int total_lines) {
  vp.top_line = recompute_top_line(vp.top_line, cur, total_lines, vp.height);
  vp.left_col = recompute_left_col(vp.left_col, cur, text_width(vp));
}
