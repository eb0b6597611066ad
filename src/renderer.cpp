#include "renderer.hpp"
#include <algorithm>
#include <string>
#include "processor.hpp"
#include "viewport.hpp"
#include "config.hpp"
#include "text_util.hpp"

static const char* const kHelpLines[] = {
  "^X        Exit (asks to save a modified buffer)",
  "^O        Write the buffer to disk",
  "^G        Show or hide this help",
  "Arrows    Move the cursor",
  "Home/End  Start/end of line",
  "PgUp/PgDn Move by a page",
  "Enter     Split the line",
  "Backspace Delete back / join lines",
};
static constexpr int kHelpLineCount = static_cast<int>(sizeof(kHelpLines) / sizeof(kHelpLines[0]));

static std::string display_name(const EditorState& st) {
  if (!st.file_path) return std::string();
  std::string name = st.file_path->filename().string();
  return name.empty() ? st.file_path->string() : name;
}

ScreenLayout compute_layout(int rows, const Settings& settings) {
  ScreenLayout L;
  if (rows <= 0) return L;
  int used = 0;
  L.status_row = rows - 1;
  used += MNANO_STATUS_ROWS;
  if (settings.show_helpbar && rows >= 4) {
    L.helpbar_row = rows - 1;
    L.status_row = rows - 2;
    used += MNANO_HELPBAR_ROWS;
  }
  if (rows >= 3) {
    L.title_row = 0;
    used += MNANO_TITLE_ROWS;
  }
  L.text_top = L.title_row >= 0 ? 1 : 0;
  L.text_height = std::max(0, rows - used);
  return L;
}

void fit_viewport(EditorState& st, int rows, int cols) {
  ScreenLayout L = compute_layout(rows, st.settings);
  st.vp.height = std::max(1, L.text_height);
  st.vp.width = std::max(0, cols);
  st.vp.gutter_width = st.settings.show_line_numbers ? gutter_width_for(st.buf.line_count()) : 0;
  if (st.vp.gutter_width >= st.vp.width) st.vp.gutter_width = 0;
  scroll_to_cursor(st.vp, screen_position(st.buf), st.buf.line_count());
}

Cursor screen_position(const TextBuffer& buf) {
  const Cursor& cur = buf.cursor();
  return Cursor{cur.row, utf8_column(buf.line(cur.row), static_cast<size_t>(cur.col))};
}

void Renderer::draw_title(Frame& f, const EditorState& st, int row) const {
  f.fill_row(row, AttrReverse);
  std::string name = display_name(st);
  std::string title = std::string(" ") + MNANO_NAME + " " + MNANO_VERSION + "    File: " +
                      (name.empty() ? std::string("New Buffer") : name);
  f.put_text(row, 0, title, AttrReverse);
}

void Renderer::draw_text(Frame& f, const EditorState& st, const ScreenLayout& L) const {
  const Viewport& vp = st.vp;
  for (int i = 0; i < L.text_height; ++i) {
    int line_idx = vp.top_line + i;
    if (line_idx >= st.buf.line_count()) break;
    int row = L.text_top + i;
    if (vp.gutter_width > 0) {
      std::string num = std::to_string(line_idx + 1);
      std::string pad(static_cast<size_t>(std::max(0, vp.gutter_width - 1 - static_cast<int>(num.size()))), ' ');
      f.put_text(row, 0, pad + num, AttrAccent);
    }
    const std::string& s = st.buf.line(line_idx);
    size_t start = utf8_offset(s, vp.left_col);
    f.put_text(row, vp.gutter_width, std::string_view(s).substr(start));
  }
}

void Renderer::draw_status(Frame& f, const EditorState& st, int row) const {
  f.fill_row(row, AttrReverse);
  if (st.prompt) {
    f.put_text(row, 0, std::string(EditCommandProcessor::kSavePrompt) + st.prompt->input, AttrReverse);
    return;
  }
  if (st.exit_state == ExitState::ExitPending) {
    f.put_text(row, 0, EditCommandProcessor::kExitPrompt, AttrReverse);
    return;
  }
  std::string name = display_name(st);
  std::string left = " " + (name.empty() ? std::string("[No Name]") : name) + " - " +
                     std::to_string(st.buf.line_count()) + " lines";
  if (st.buf.modified()) left += " [Modified]";
  Cursor cur = screen_position(st.buf);
  std::string right = "Ln " + std::to_string(cur.row + 1) + ", Col " + std::to_string(cur.col + 1) + " ";
  int right_col = std::max(0, f.cols() - static_cast<int>(right.size()));
  int col = f.put_text(row, 0, left, AttrReverse);
  if (!st.message.empty()) {
    std::string msg = "  " + st.message;
    int room = std::max(0, right_col - col - 1);
    f.put_text(row, col, msg.substr(0, utf8_offset(msg, room)), AttrReverse);
  }
  f.put_text(row, right_col, right, AttrReverse);
}

void Renderer::draw_helpbar(Frame& f, int row) const {
  f.fill_row(row, AttrNone);
  int col = 0;
  const char* keys[][2] = {{"^X", "Exit"}, {"^O", "Save"}, {"^G", "Help"}};
  for (const auto& k : keys) {
    col = f.put_text(row, col, k[0], AttrReverse);
    col = f.put_text(row, col, std::string(" ") + k[1] + "    ");
  }
}

void Renderer::draw_help_panel(Frame& f, const ScreenLayout& L) const {
  int h = std::min(kHelpLineCount + 3, L.text_height);
  if (h <= 0 || f.cols() < 2) return;
  int top = L.text_top + L.text_height - h;
  int w = f.cols();
  for (int r = top; r < top + h; ++r) f.fill_row(r, AttrNone);
  f.fill_row(top, AttrReverse);
  f.put_text(top, 1, " Help ", static_cast<unsigned char>(AttrReverse | AttrBold));
  for (int i = 0; i + 1 < h; ++i) {
    int r = top + 1 + i;
    f.at(r, 0) = Cell{U'|', AttrNone};
    f.at(r, w - 1) = Cell{U'|', AttrNone};
    if (i == h - 2) {
      for (int c = 0; c < w; ++c) f.at(r, c) = Cell{c == 0 || c == w - 1 ? U'+' : U'-', AttrNone};
    } else if (i >= 1 && i - 1 < kHelpLineCount) {
      std::string_view text = kHelpLines[i - 1];
      f.put_text(r, 2, text.substr(0, static_cast<size_t>(std::max(0, w - 4))));
    }
  }
}

Frame Renderer::render(const EditorState& st, int rows, int cols) const {
  Frame f(rows, cols);
  if (f.empty()) return f;
  ScreenLayout L = compute_layout(rows, st.settings);
  if (L.title_row >= 0) draw_title(f, st, L.title_row);
  draw_text(f, st, L);
  if (st.input_mode == InputMode::HelpOverlay) draw_help_panel(f, L);
  if (L.status_row >= 0) draw_status(f, st, L.status_row);
  if (L.helpbar_row >= 0) draw_helpbar(f, L.helpbar_row);
  return f;
}

Cursor Renderer::screen_cursor(const EditorState& st, int rows, int cols) const {
  ScreenLayout L = compute_layout(rows, st.settings);
  int max_col = std::max(0, cols - 1);
  if (st.prompt && L.status_row >= 0) {
    const std::string& in = st.prompt->input;
    int c = static_cast<int>(std::string_view(EditCommandProcessor::kSavePrompt).size()) + utf8_column(in, in.size());
    return Cursor{L.status_row, std::min(c, max_col)};
  }
  if (L.text_height <= 0) return Cursor{std::max(0, L.status_row), 0};
  Cursor cur = screen_position(st.buf);
  int r = L.text_top + std::clamp(cur.row - st.vp.top_line, 0, L.text_height - 1);
  int c = st.vp.gutter_width + std::max(0, cur.col - st.vp.left_col);
  return Cursor{r, std::min(c, max_col)};
}

size_t Renderer::present(ITerminal& term, const Frame& next, const Cursor& screen_cursor) {
  if (prev_.rows() != next.rows() || prev_.cols() != next.cols()) {
    term.clear();
    prev_ = Frame(next.rows(), next.cols());
  }
  std::vector<CellRun> runs = diff_frames(prev_, next);
  for (const CellRun& run : runs) term.write_cell_run(run.row, run.col_start, run.cells);
  if (!next.empty()) term.move_cursor(screen_cursor.row, screen_cursor.col);
  term.flush();
  prev_ = next;
  return runs.size();
}
