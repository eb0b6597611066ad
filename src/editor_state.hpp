#pragma once
/*
 * EditorState
 *
 * Purpose: everything the edit loop mutates, in one place.
 * Ownership: a single instance owned by Editor and passed by reference to the
 *            processor and renderer each iteration; no component keeps a copy.
 */
#include <optional>
#include <string>
#include <filesystem>
#include "text_buffer.hpp"
#include "settings.hpp"
#include "types.hpp"

struct SavePrompt {
  std::string input;
  bool exit_after = false; // opened from ExitPending
};

struct EditorState {
  TextBuffer buf;
  std::optional<std::filesystem::path> file_path;
  Viewport vp;
  ExitState exit_state = ExitState::Editing;
  InputMode input_mode = InputMode::Normal;
  std::string message;
  std::optional<SavePrompt> prompt;
  Settings settings;
};
