#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Input: scripted poll batches; read_key() opens the next batch, poll_key()
 *        drains the rest of it. Input is closed once all batches are consumed.
 * Output: cell runs land in a Frame that mirrors what a real screen would show;
 *         clears, flushes and written cells are counted.
 */
#include <deque>
#include <string>
#include <string_view>
#include <vector>
#include "iterminal.hpp"
#include "types.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  static KeyEvent key(char c) { return {KeyCode::Char, static_cast<unsigned char>(c), ModNone}; }
  static KeyEvent ctrl(char c) { return {KeyCode::Char, c, ModCtrl}; }
  static KeyEvent special(KeyCode code) { return {code, 0, ModNone}; }

  void push_batch(std::vector<KeyEvent> batch);
  // One batch per character, as if typed slowly.
  void type(std::string_view text);
  void press(const KeyEvent& ev) { push_batch({ev}); }
  // Changes the size and queues a Resize event.
  void resize(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  bool read_key(KeyEvent& out) override;
  bool poll_key(KeyEvent& out) override;
  void clear() override;
  void write_cell_run(int row, int col, const std::vector<Cell>& cells) override;
  void move_cursor(int row, int col) override { cursor_ = Cursor{row, col}; }
  void flush() override { flush_count_++; }

  const Frame& screen() const { return screen_; }
  std::string row_text(int row) const;
  Cursor cursor() const { return cursor_; }
  int clear_count() const { return clear_count_; }
  int flush_count() const { return flush_count_; }
  size_t cells_written() const { return cells_written_; }
  void reset_counters() { clear_count_ = 0; flush_count_ = 0; cells_written_ = 0; }

private:
  int rows_;
  int cols_;
  std::deque<std::vector<KeyEvent>> batches_;
  std::deque<KeyEvent> current_;
  Frame screen_;
  Cursor cursor_{};
  int clear_count_ = 0;
  int flush_count_ = 0;
  size_t cells_written_ = 0;
};
