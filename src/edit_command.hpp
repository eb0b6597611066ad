#pragma once
/*
 * EditCommand
 *
 * Purpose: closed set of editor commands produced by the input dispatcher.
 * Design: tag + payload; consumers switch over Kind without a default case so
 *         the compiler flags any kind left unhandled.
 */
#include "types.hpp"

struct EditCommand {
  enum class Kind { InsertChar, InsertNewline, DeleteBackward, MoveCursor, Save, Quit, ToggleHelp, Cancel, NoOp };
  Kind kind = Kind::NoOp;
  char ch = 0;                      // InsertChar
  Direction dir = Direction::Right; // MoveCursor

  static EditCommand insert_char(char c) { return {Kind::InsertChar, c, Direction::Right}; }
  static EditCommand move(Direction d) { return {Kind::MoveCursor, 0, d}; }
  static EditCommand of(Kind k) { return {k, 0, Direction::Right}; }

  bool operator==(const EditCommand&) const = default;
};
