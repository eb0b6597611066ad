#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Cursor/Viewport/Direction/states).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class Direction { Up, Down, Left, Right, Home, End, PageUp, PageDown };

enum class ExitState { Editing, ExitPending, Exited };

enum class InputMode { Normal, HelpOverlay };

enum class LineEnding { LF, CRLF };

struct Cursor {
  int row = 0;
  int col = 0;
  bool operator==(const Cursor&) const = default;
};

struct Viewport {
  int top_line = 0;
  int left_col = 0;
  int width = 0;
  int height = 1;
  int gutter_width = 0; // 0: line numbers off
};
