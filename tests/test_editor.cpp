#include "editor.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

using HT = HeadlessTerminal;

static std::filesystem::path scratch_dir() {
  auto d = std::filesystem::temp_directory_path() / ("mnano_ed_" + std::to_string(::getpid()));
  std::filesystem::create_directories(d);
  return d;
}

static void spit(const std::filesystem::path& p, const std::string& data) {
  std::ofstream o(p, std::ios::binary);
  o << data;
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static void test_open_into() {
  auto dir = scratch_dir();
  std::string msg;

  EditorState fresh;
  fresh.settings.new_file_ending = LineEnding::CRLF;
  assert(open_into(fresh, dir / "new.txt", msg));
  assert(msg == "New File");
  assert(fresh.buf.empty());
  assert(fresh.buf.line_ending() == LineEnding::CRLF);
  assert(fresh.file_path && *fresh.file_path == dir / "new.txt");

  spit(dir / "two.txt", "a\nb\n");
  EditorState st;
  assert(open_into(st, dir / "two.txt", msg));
  assert(st.buf.line_count() == 2);
  assert(st.message == "Read 2 lines");

  spit(dir / "bad.txt", std::string("ok\n\xc3\x28\n"));
  EditorState bad;
  assert(!open_into(bad, dir / "bad.txt", msg));
  assert(!bad.file_path);
  assert(!msg.empty());

  EditorState d;
  assert(!open_into(d, dir, msg));
  std::filesystem::remove_all(dir);
}

static void test_type_save_as_and_exit() {
  auto dir = scratch_dir();
  auto target = dir / "t.txt";
  HeadlessTerminal term(12, 60);
  term.type("hi");
  term.press(HT::special(KeyCode::Enter));
  term.type("bye");
  term.press(HT::ctrl('o'));
  term.type(target.string());
  term.press(HT::special(KeyCode::Enter));
  term.press(HT::ctrl('x'));

  Editor ed(term, EditorState());
  assert(ed.run() == 0);
  assert(ed.state().exit_state == ExitState::Exited);
  assert(!ed.state().buf.modified());
  assert(slurp(target) == "hi\nbye");
  std::filesystem::remove_all(dir);
}

static void test_join_and_save_existing_file() {
  auto dir = scratch_dir();
  auto p = dir / "join.txt";
  spit(p, "alpha\nbeta\n");
  EditorState st;
  std::string msg;
  assert(open_into(st, p, msg));

  HeadlessTerminal term(12, 60);
  term.press(HT::special(KeyCode::Down));
  term.press(HT::special(KeyCode::Backspace));
  term.press(HT::ctrl('o'));
  term.press(HT::special(KeyCode::Enter));
  term.press(HT::ctrl('x'));
  Editor ed(term, std::move(st));
  assert(ed.run() == 0);
  assert(ed.state().buf.line_count() == 1);
  assert(slurp(p) == "alphabeta\n");
  std::filesystem::remove_all(dir);
}

static void test_double_quit_discards() {
  HeadlessTerminal term(12, 60);
  term.type("abc");
  term.press(HT::ctrl('x'));
  term.press(HT::ctrl('x'));
  Editor ed(term, EditorState());
  assert(ed.run() == 0);
  assert(ed.state().buf.modified());
  assert(ed.state().buf.line(0) == "abc");
}

static void test_single_quit_with_changes_waits() {
  HeadlessTerminal term(12, 60);
  term.type("abc");
  term.press(HT::ctrl('x'));
  Editor ed(term, EditorState());
  // input closes while the exit is pending
  assert(ed.run() == 1);
  assert(ed.state().exit_state == ExitState::ExitPending);
  assert(term.row_text(10).find("Save modified buffer?") == 0);
}

static void test_repeated_quit_in_one_poll_collapses() {
  HeadlessTerminal term(12, 60);
  term.type("abc");
  term.push_batch({HT::ctrl('x'), HT::ctrl('x')});
  Editor ed(term, EditorState());
  assert(ed.run() == 1);
  assert(ed.state().exit_state == ExitState::ExitPending);
}

static void test_screen_updates_incrementally() {
  HeadlessTerminal term(10, 40);
  term.type("hi");
  Editor ed(term, EditorState());
  assert(ed.step());
  assert(term.clear_count() == 1);
  assert(ed.step());
  assert(term.row_text(1).substr(0, 3) == "hi ");
  assert(term.cursor() == (Cursor{1, 2}));
  assert(term.clear_count() == 1);
  assert(term.screen() == ed.renderer().previous());

  term.reset_counters();
  term.type("!");
  assert(ed.step());
  assert(term.clear_count() == 0);
  assert(term.cells_written() < 10);

  term.resize(14, 50);
  assert(ed.step());
  assert(term.clear_count() == 1);
  assert(term.screen().rows() == 14 && term.screen().cols() == 50);
  assert(term.row_text(1).substr(0, 4) == "hi! ");
  assert(term.screen() == ed.renderer().previous());

  assert(!ed.step());
}

static void test_help_overlay_blocks_editing() {
  HeadlessTerminal term(14, 60);
  term.press(HT::ctrl('g'));
  term.type("zz");
  term.press(HT::ctrl('g'));
  term.press(HT::ctrl('x'));
  Editor ed(term, EditorState());
  assert(ed.run() == 0);
  assert(ed.state().buf.empty());
}

int main() {
  test_open_into();
  test_type_save_as_and_exit();
  test_join_and_save_existing_file();
  test_double_quit_discards();
  test_single_quit_with_changes_waits();
  test_repeated_quit_in_one_poll_collapses();
  test_screen_updates_incrementally();
  test_help_overlay_blocks_editing();
  return 0;
}
