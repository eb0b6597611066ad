#include "screen.hpp"
#include <algorithm>
#include "text_util.hpp"

Frame::Frame(int rows, int cols)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)),
      cells_(static_cast<size_t>(rows_) * static_cast<size_t>(cols_)) {}

void Frame::fill_row(int row, unsigned char attrs) {
  if (row < 0 || row >= rows_) return;
  for (int c = 0; c < cols_; ++c) at(row, c) = Cell{U' ', attrs};
}

int Frame::put_text(int row, int col, std::string_view text, unsigned char attrs) {
  if (row < 0 || row >= rows_) return col;
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    size_t len = 1;
    char32_t ch = utf8_decode(text, i, len);
    // stray continuation bytes belong to the cell before them
    if (ch == U'?' && is_utf8_continuation(static_cast<unsigned char>(text[i]))) { i++; continue; }
    i += len;
    if (ch == U'\t') ch = U' ';
    else if (ch < 0x20 || (ch >= 0x7f && ch < 0xa0)) ch = U'?';
    if (col >= 0) at(row, col) = Cell{ch, attrs};
    col++;
  }
  return col;
}

static CellRun make_run(const Frame& next, int row, int c0, int c1) {
  CellRun run{row, c0, c1, {}};
  run.cells.reserve(static_cast<size_t>(c1 - c0));
  for (int c = c0; c < c1; ++c) run.cells.push_back(next.at(row, c));
  return run;
}

std::vector<CellRun> diff_frames(const Frame& prev, const Frame& next) {
  std::vector<CellRun> runs;
  if (prev.rows() != next.rows() || prev.cols() != next.cols()) {
    if (next.cols() == 0) return runs;
    for (int r = 0; r < next.rows(); ++r) runs.push_back(make_run(next, r, 0, next.cols()));
    return runs;
  }
  int cols = next.cols();
  for (int r = 0; r < next.rows(); ++r) {
    int c = 0;
    while (c < cols) {
      if (prev.at(r, c) == next.at(r, c)) { c++; continue; }
      int start = c;
      while (c < cols && prev.at(r, c) != next.at(r, c)) c++;
      runs.push_back(make_run(next, r, start, c));
    }
  }
  return runs;
}

void apply_run(Frame& frame, const CellRun& run) {
  if (run.row < 0 || run.row >= frame.rows()) return;
  int c = run.col_start;
  for (const Cell& cell : run.cells) {
    if (c >= frame.cols()) break;
    if (c >= 0) frame.at(run.row, c) = cell;
    c++;
  }
}
