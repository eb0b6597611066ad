#include "processor.hpp"
#include <algorithm>
#include "text_util.hpp"

using K = EditCommand::Kind;

void EditCommandProcessor::apply(EditorState& st, const EditCommand& cmd) const {
  if (st.exit_state == ExitState::Exited) return;
  if (st.prompt) { apply_prompt(st, cmd); return; }
  if (st.exit_state == ExitState::ExitPending) {
    if (cmd.kind == K::Quit) { st.exit_state = ExitState::Exited; return; }
    if (cmd.kind == K::Save) { save(st, true); return; }
    st.exit_state = ExitState::Editing;
    st.message.clear();
  }
  apply_edit(st, cmd);
}

void EditCommandProcessor::apply_edit(EditorState& st, const EditCommand& cmd) const {
  TextBuffer& buf = st.buf;
  if (cmd.kind != K::Save && cmd.kind != K::NoOp) st.message.clear();
  switch (cmd.kind) {
    case K::InsertChar: buf.insert_char(buf.cursor(), cmd.ch); break;
    case K::InsertNewline: buf.insert_newline(buf.cursor()); break;
    case K::DeleteBackward: buf.delete_backward(buf.cursor()); break;
    case K::MoveCursor: buf.move_cursor(cmd.dir, std::max(1, st.vp.height - 1)); break;
    case K::Save: save(st, false); break;
    case K::Quit: quit(st); break;
    case K::ToggleHelp:
      st.input_mode = st.input_mode == InputMode::Normal ? InputMode::HelpOverlay : InputMode::Normal;
      break;
    case K::Cancel: break;
    case K::NoOp: break;
  }
}

void EditCommandProcessor::apply_prompt(EditorState& st, const EditCommand& cmd) const {
  SavePrompt& p = *st.prompt;
  switch (cmd.kind) {
    case K::InsertChar: p.input.push_back(cmd.ch); break;
    case K::DeleteBackward: p.input.erase(utf8_prev(p.input, p.input.size())); break;
    case K::InsertNewline: {
      std::string name = trim(p.input);
      if (name.empty()) { st.message = "File name is empty"; break; }
      bool exiting = p.exit_after;
      st.prompt.reset();
      bool ok = save_to(st, name);
      if (exiting) st.exit_state = ok ? ExitState::Exited : ExitState::Editing;
      break;
    }
    case K::Cancel:
    case K::ToggleHelp:
      if (p.exit_after) st.exit_state = ExitState::Editing;
      st.prompt.reset();
      st.message = "Cancelled";
      break;
    case K::Quit:
      // Abandon the prompt, then quit from whatever state opened it.
      st.prompt.reset();
      apply(st, cmd);
      break;
    case K::MoveCursor:
    case K::Save:
    case K::NoOp:
      break;
  }
}

void EditCommandProcessor::quit(EditorState& st) const {
  st.input_mode = InputMode::Normal;
  if (!st.buf.modified()) { st.exit_state = ExitState::Exited; return; }
  st.exit_state = ExitState::ExitPending;
}

void EditCommandProcessor::save(EditorState& st, bool exiting) const {
  st.prompt = SavePrompt{st.file_path ? st.file_path->string() : std::string(), exiting};
  st.message.clear();
}

bool EditCommandProcessor::save_to(EditorState& st, const std::filesystem::path& path) const {
  std::string msg;
  bool ok = st.buf.write_file(path, msg);
  st.message = msg;
  if (ok) st.file_path = path;
  return ok;
}
