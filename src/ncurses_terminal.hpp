#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for key input and cell runs.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  TermSize get_size() const override;
  bool read_key(KeyEvent& out) override;
  bool poll_key(KeyEvent& out) override;
  void clear() override;
  void write_cell_run(int row, int col, const std::vector<Cell>& cells) override;
  void move_cursor(int row, int col) override;
  void flush() override;

  static KeyEvent translate(int ch);

private:
  attr_t to_curses(unsigned char attrs) const;
  bool colors_ = false;
};
