#pragma once
/*
 * InputDispatcher
 *
 * Purpose: turn raw key events into EditCommands through a static binding table.
 * Feature: identical raw events arriving in one poll batch collapse into one
 *          logical event (some input layers report a single press twice).
 * Note: the input mode lives in EditorState and is passed in per call; the
 *       dispatcher only keeps events already read but not yet consumed.
 */
#include <deque>
#include <vector>
#include "edit_command.hpp"
#include "iterminal.hpp"

class InputDispatcher {
public:
  static EditCommand map_key(const KeyEvent& ev, InputMode mode);
  static void collapse_repeats(std::vector<KeyEvent>& batch);

  // Blocks for the next logical event; false once input is closed.
  bool next_command(ITerminal& term, InputMode mode, EditCommand& out);
  bool take_resized();
  void set_collapse(bool on) { collapse_ = on; }
  bool collapse() const { return collapse_; }

private:
  bool fill(ITerminal& term);

  std::deque<KeyEvent> pending_;
  bool collapse_ = true;
  bool resized_ = false;
};
