#pragma once
/*
 * EditCommandProcessor
 *
 * Purpose: apply EditCommands to EditorState and drive the exit state machine.
 *
 *   Editing     --Quit, unmodified-->  Exited
 *   Editing     --Quit, modified---->  ExitPending
 *   ExitPending --Quit-------------->  Exited        (changes discarded)
 *   ExitPending --Save ok----------->  Exited
 *   ExitPending --Save failed------->  Editing
 *   ExitPending --anything else----->  Editing, then the command applies
 *
 * Save always goes through the file name prompt, filled in with the current
 * name; Enter confirms it. A pending exit is carried through the prompt.
 */
#include <filesystem>
#include "edit_command.hpp"
#include "editor_state.hpp"

class EditCommandProcessor {
public:
  void apply(EditorState& st, const EditCommand& cmd) const;

  static constexpr const char* kExitPrompt = "Save modified buffer?  ^O Save  ^X Discard  (any other key cancels)";
  static constexpr const char* kSavePrompt = "File Name to Write: ";

private:
  void apply_edit(EditorState& st, const EditCommand& cmd) const;
  void apply_prompt(EditorState& st, const EditCommand& cmd) const;
  void quit(EditorState& st) const;
  void save(EditorState& st, bool exiting) const;
  bool save_to(EditorState& st, const std::filesystem::path& path) const;
};
