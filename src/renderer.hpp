#pragma once
/*
 * Renderer
 *
 * Purpose: build the Frame for the current EditorState (title bar, text rows,
 *          status row, shortcut bar, help overlay) and present it as a diff
 *          against the previously presented Frame.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: the terminal is cleared only when the frame size changes.
 */
#include <cstddef>
#include "editor_state.hpp"
#include "iterminal.hpp"
#include "screen.hpp"
#include "types.hpp"

struct ScreenLayout {
  int title_row = -1;   // -1: not shown
  int text_top = 0;
  int text_height = 0;
  int status_row = -1;
  int helpbar_row = -1;
};

ScreenLayout compute_layout(int rows, const Settings& settings);

// Cursor as (row, screen column); the buffer cursor column is a byte offset.
Cursor screen_position(const TextBuffer& buf);

// Sizes the viewport for the terminal and scrolls it to the cursor.
void fit_viewport(EditorState& st, int rows, int cols);

class Renderer {
public:
  Frame render(const EditorState& st, int rows, int cols) const;
  Cursor screen_cursor(const EditorState& st, int rows, int cols) const;
  // Returns the number of cell runs written.
  size_t present(ITerminal& term, const Frame& next, const Cursor& screen_cursor);
  const Frame& previous() const { return prev_; }
  void invalidate() { prev_ = Frame(); }

private:
  void draw_title(Frame& f, const EditorState& st, int row) const;
  void draw_text(Frame& f, const EditorState& st, const ScreenLayout& L) const;
  void draw_status(Frame& f, const EditorState& st, int row) const;
  void draw_helpbar(Frame& f, int row) const;
  void draw_help_panel(Frame& f, const ScreenLayout& L) const;

  Frame prev_;
};
