#include "headless_terminal.hpp"
#include "text_util.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols), screen_(rows, cols) {}

void HeadlessTerminal::push_batch(std::vector<KeyEvent> batch) {
  if (batch.empty()) return;
  batches_.push_back(std::move(batch));
}

void HeadlessTerminal::type(std::string_view text) {
  for (char c : text) press(key(c));
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  press(special(KeyCode::Resize));
}

bool HeadlessTerminal::read_key(KeyEvent& out) {
  if (current_.empty()) {
    if (batches_.empty()) return false;
    current_.assign(batches_.front().begin(), batches_.front().end());
    batches_.pop_front();
  }
  out = current_.front();
  current_.pop_front();
  return true;
}

bool HeadlessTerminal::poll_key(KeyEvent& out) {
  if (current_.empty()) return false;
  out = current_.front();
  current_.pop_front();
  return true;
}

void HeadlessTerminal::clear() {
  screen_ = Frame(rows_, cols_);
  clear_count_++;
}

void HeadlessTerminal::write_cell_run(int row, int col, const std::vector<Cell>& cells) {
  apply_run(screen_, CellRun{row, col, col + static_cast<int>(cells.size()), cells});
  cells_written_ += cells.size();
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string s;
  if (row < 0 || row >= screen_.rows()) return s;
  for (int c = 0; c < screen_.cols(); ++c) utf8_append(s, screen_.at(row, c).ch);
  return s;
}
