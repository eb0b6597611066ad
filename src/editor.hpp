#pragma once
/*
 * Editor
 *
 * Purpose: the event loop. Each iteration reads one logical key, applies the
 *          command, recomputes the viewport, renders and presents the diff.
 * Ownership: owns the single EditorState and lends it to every stage.
 */
#include <filesystem>
#include <string>
#include "editor_state.hpp"
#include "input.hpp"
#include "processor.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"

// Loads path into st. A path that does not exist yet gives an empty buffer
// bound to it; false when the file exists but cannot be read or decoded.
bool open_into(EditorState& st, const std::filesystem::path& path, std::string& msg);

class Editor {
public:
  Editor(ITerminal& term, EditorState state);
  // Runs until Exited and returns 0; returns 1 if input closes first.
  int run();
  // One iteration; false once Exited or input is closed.
  bool step();

  const EditorState& state() const { return st_; }
  const Renderer& renderer() const { return renderer_; }

private:
  void refresh();

  ITerminal& term_;
  EditorState st_;
  InputDispatcher input_;
  EditCommandProcessor processor_;
  Renderer renderer_;
  bool started_ = false;
};
