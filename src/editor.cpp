#include "editor.hpp"
#include <system_error>

bool open_into(EditorState& st, const std::filesystem::path& path, std::string& msg) {
  std::error_code ec;
  bool exists = std::filesystem::exists(path, ec);
  if (ec) { msg = std::string("can not access file: ") + path.string(); return false; }
  if (!exists) {
    st.file_path = path;
    st.buf = TextBuffer();
    st.buf.set_line_ending(st.settings.new_file_ending);
    msg = "New File";
    st.message = msg;
    return true;
  }
  bool ok = false;
  TextBuffer b = TextBuffer::from_file(path, msg, ok);
  if (!ok) return false;
  st.file_path = path;
  st.buf = std::move(b);
  st.message = "Read " + std::to_string(st.buf.line_count()) + " lines";
  return true;
}

Editor::Editor(ITerminal& term, EditorState state)
    : term_(term), st_(std::move(state)) {
  input_.set_collapse(st_.settings.collapse_repeats);
}

void Editor::refresh() {
  TermSize sz = term_.get_size();
  fit_viewport(st_, sz.rows, sz.cols);
  Frame next = renderer_.render(st_, sz.rows, sz.cols);
  renderer_.present(term_, next, renderer_.screen_cursor(st_, sz.rows, sz.cols));
}

bool Editor::step() {
  if (!started_) { started_ = true; refresh(); }
  if (st_.exit_state == ExitState::Exited) return false;
  EditCommand cmd;
  if (!input_.next_command(term_, st_.input_mode, cmd)) return false;
  processor_.apply(st_, cmd);
  if (st_.exit_state == ExitState::Exited) return false;
  if (input_.take_resized()) renderer_.invalidate();
  refresh();
  return true;
}

int Editor::run() {
  while (step()) {}
  return st_.exit_state == ExitState::Exited ? 0 : 1;
}
