#pragma once
/*
 * Screen
 *
 * Purpose: cell grid (Frame) that mirrors the physical terminal, and the
 *          row-by-row diff that turns two frames into minimal cell runs.
 * Invariant: applying every run of diff_frames(prev, next) to prev gives next.
 */
#include <string_view>
#include <vector>

enum CellAttr : unsigned char {
  AttrNone = 0,
  AttrReverse = 1 << 0,
  AttrBold = 1 << 1,
  AttrAccent = 1 << 2, // line numbers
};

// One screen column: a decoded code point.
struct Cell {
  char32_t ch = U' ';
  unsigned char attrs = AttrNone;
  bool operator==(const Cell&) const = default;
};

class Frame {
public:
  Frame() = default;
  Frame(int rows, int cols);

  int rows() const { return rows_; }
  int cols() const { return cols_; }
  bool empty() const { return rows_ == 0 || cols_ == 0; }
  Cell& at(int row, int col) { return cells_[static_cast<size_t>(row * cols_ + col)]; }
  const Cell& at(int row, int col) const { return cells_[static_cast<size_t>(row * cols_ + col)]; }

  void fill_row(int row, unsigned char attrs);
  // Decodes UTF-8 into one cell per code point; control characters show as
  // '?', tabs as ' '. Clipped to the frame; returns the column after the last
  // cell written.
  int put_text(int row, int col, std::string_view text, unsigned char attrs = AttrNone);

  bool operator==(const Frame&) const = default;

private:
  int rows_ = 0;
  int cols_ = 0;
  std::vector<Cell> cells_;
};

// Cells [col_start, col_end) of one row.
struct CellRun {
  int row = 0;
  int col_start = 0;
  int col_end = 0;
  std::vector<Cell> cells;
};

std::vector<CellRun> diff_frames(const Frame& prev, const Frame& next);
void apply_run(Frame& frame, const CellRun& run);
