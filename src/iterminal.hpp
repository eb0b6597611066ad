#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, key input, cell runs, cursor, flush).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Note: clear() is reserved for resizes; normal frames go out as cell runs.
 */
#include <vector>
#include "screen.hpp"

struct TermSize { int rows; int cols; };

enum class KeyCode {
  None, Char, Enter, Backspace, Tab, Escape,
  Up, Down, Left, Right, Home, End, PageUp, PageDown, Delete,
  Resize, Unknown
};

enum KeyMod : unsigned {
  ModNone = 0,
  ModCtrl = 1u << 0,
  ModAlt = 1u << 1,
  ModShift = 1u << 2,
};

struct KeyEvent {
  KeyCode code = KeyCode::None;
  int ch = 0; // byte value when code == Char
  unsigned mods = ModNone;
  bool operator==(const KeyEvent&) const = default;
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  // Blocks until a key arrives; false once input is closed.
  virtual bool read_key(KeyEvent& out) = 0;
  // Non-blocking; false when nothing is queued.
  virtual bool poll_key(KeyEvent& out) = 0;
  virtual void clear() = 0;
  virtual void write_cell_run(int row, int col, const std::vector<Cell>& cells) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void flush() = 0;
};
