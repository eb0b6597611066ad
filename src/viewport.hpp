#pragma once
/*
 * Viewport
 *
 * Purpose: keep the cursor inside the visible window (vertical + horizontal).
 * Principle: pure functions of the previous offset, cursor and geometry; no
 *            dependency on edit history.
 */
#include "types.hpp"

int recompute_top_line(int top_line, const Cursor& cur, int total_lines, int height);
int recompute_left_col(int left_col, const Cursor& cur, int text_width);

// Digits of the largest line number plus one separator column.
int gutter_width_for(int total_lines);

int text_width(const Viewport& vp);

void scroll_to_cursor(Viewport& vp, const Cursor& cur, int total_lines);
