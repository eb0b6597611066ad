#include "text_buffer.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

static std::filesystem::path scratch_dir() {
  auto d = std::filesystem::temp_directory_path() / ("mnano_tb_" + std::to_string(::getpid()));
  std::filesystem::create_directories(d);
  return d;
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static TextBuffer load(const std::string& data) {
  std::istringstream in(data);
  TextBuffer b;
  std::string msg;
  bool ok = TextBuffer::from_stream(in, b, msg);
  assert(ok);
  return b;
}

static void test_insert_and_split() {
  TextBuffer b;
  assert(b.empty());
  assert(!b.modified());
  Cursor c = b.insert_char(b.cursor(), 'h');
  c = b.insert_char(c, 'i');
  assert(c == (Cursor{0, 2}));
  assert(b.modified());
  c = b.insert_newline(c);
  assert(c == (Cursor{1, 0}));
  for (char ch : std::string("bye")) c = b.insert_char(c, ch);
  assert(b.line_count() == 2);
  assert(b.line(0) == "hi");
  assert(b.line(1) == "bye");
  assert(b.text() == "hi\nbye");

  // split in the middle of a line
  c = b.insert_newline(Cursor{1, 1});
  assert(b.line(1) == "b");
  assert(b.line(2) == "ye");
  assert(c == (Cursor{2, 0}));
  assert(b.cursor() == c);
}

static void test_insert_clamps_and_appends() {
  TextBuffer b = load("ab");
  Cursor c = b.insert_char(Cursor{0, 99}, 'c');
  assert(b.line(0) == "abc");
  assert(c == (Cursor{0, 3}));
  c = b.insert_char(Cursor{7, 0}, 'z');
  assert(b.line(0) == "zabc");
  assert(c == (Cursor{0, 1}));
}

static void test_delete_backward() {
  TextBuffer b = load("abc\ndef");
  Cursor c = b.delete_backward(Cursor{0, 0});
  assert(c == (Cursor{0, 0}));
  assert(!b.modified());
  assert(b.text() == "abc\ndef");

  c = b.delete_backward(Cursor{0, 2});
  assert(b.line(0) == "ac");
  assert(c == (Cursor{0, 1}));
  assert(b.modified());
}

static void test_join_lines() {
  TextBuffer b = load("one\ntwo\nthree\n");
  assert(b.line_count() == 3);
  b.set_cursor(Cursor{1, 0});
  Cursor c = b.delete_backward(b.cursor());
  assert(b.line_count() == 2);
  assert(b.line(0) == "onetwo");
  assert(b.line(1) == "three");
  assert(c == (Cursor{0, 3}));
  assert(b.modified());
}

static void test_move_cursor() {
  TextBuffer b = load("abcd\nx\nlonger line");
  assert(b.move_cursor(Direction::Up) == (Cursor{0, 0}));
  assert(b.move_cursor(Direction::Left) == (Cursor{0, 0}));
  assert(b.move_cursor(Direction::End) == (Cursor{0, 4}));
  assert(b.move_cursor(Direction::Down) == (Cursor{1, 1}));
  assert(b.move_cursor(Direction::Right) == (Cursor{2, 0}));
  assert(b.move_cursor(Direction::Left) == (Cursor{1, 1}));
  assert(b.move_cursor(Direction::PageDown, 10) == (Cursor{2, 1}));
  assert(b.move_cursor(Direction::End) == (Cursor{2, 11}));
  assert(b.move_cursor(Direction::Right) == (Cursor{2, 11}));
  assert(b.move_cursor(Direction::Down) == (Cursor{2, 11}));
  assert(b.move_cursor(Direction::PageUp, 10) == (Cursor{0, 4}));
  assert(b.move_cursor(Direction::Home) == (Cursor{0, 0}));
  assert(!b.modified());
}

// Random edit scripts replayed on a buffer match a plain string model.
static void test_replay_matches_model() {
  std::mt19937 rng(12345);
  for (int round = 0; round < 200; ++round) {
    TextBuffer b;
    std::string model;
    size_t pos = 0;
    for (int i = 0; i < 60; ++i) {
      int op = static_cast<int>(rng() % 4);
      if (op <= 1) {
        char ch = static_cast<char>('a' + rng() % 26);
        b.insert_char(b.cursor(), ch);
        model.insert(pos, 1, ch);
        pos++;
      } else if (op == 2) {
        b.insert_newline(b.cursor());
        model.insert(pos, 1, '\n');
        pos++;
      } else {
        b.delete_backward(b.cursor());
        if (pos > 0) { model.erase(pos - 1, 1); pos--; }
      }
      assert(b.text() == model);
    }
  }
}

static void test_load_records_terminators() {
  TextBuffer lf = load("a\nb\n");
  assert(lf.line_count() == 2);
  assert(lf.line_ending() == LineEnding::LF);
  assert(lf.final_newline());

  TextBuffer crlf = load("a\r\nb");
  assert(crlf.line_count() == 2);
  assert(crlf.line(0) == "a");
  assert(crlf.line_ending() == LineEnding::CRLF);
  assert(!crlf.final_newline());

  TextBuffer none = load("");
  assert(none.line_count() == 1);
  assert(none.empty());
}

static void test_decode_error_fails_load() {
  std::istringstream in(std::string("ok\n\xff\xfe bad"));
  TextBuffer b;
  std::string msg;
  assert(!TextBuffer::from_stream(in, b, msg));
  assert(!msg.empty());
  assert(b.empty());
}

static void test_stream_round_trip() {
  const std::vector<std::string> samples = {
    "", "\n", "hi\nbye", "hi\nbye\n", "a\r\nb\r\n", "x\r\n\r\ny", "tab\there\n\n\n", "mixed\r in lf\n",
    "caf\xc3\xa9\n",
  };
  for (const std::string& s : samples) {
    TextBuffer b = load(s);
    std::ostringstream out;
    std::string msg;
    assert(b.write_stream(out, msg));
    assert(out.str() == s);
  }
}

static void test_file_round_trip_and_failure() {
  auto dir = scratch_dir();
  auto p = dir / "crlf.txt";
  {
    std::ofstream o(p, std::ios::binary);
    o << "first\r\nsecond\r\n";
  }
  std::string msg;
  bool ok = false;
  TextBuffer b = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(b.line_count() == 2);
  b.insert_char(Cursor{1, 6}, '!');
  assert(b.modified());
  assert(b.write_file(p, msg));
  assert(!b.modified());
  assert(slurp(p) == "first\r\nsecond!\r\n");
  assert(!std::filesystem::exists(dir / "crlf.txt.tmp"));

  b.insert_char(b.cursor(), '?');
  assert(!b.write_file(dir / "missing" / "x.txt", msg));
  assert(b.modified());
  assert(msg.find("write file failed") != std::string::npos);

  TextBuffer missing = TextBuffer::from_file(dir / "nope.txt", msg, ok);
  assert(!ok);
  assert(missing.empty());
  std::filesystem::remove_all(dir);
}

static void test_multibyte_editing() {
  // "café" then "naïve"
  TextBuffer b = load("caf\xc3\xa9\nna\xc3\xafve\n");
  assert(b.move_cursor(Direction::End) == (Cursor{0, 5}));
  assert(b.move_cursor(Direction::Left) == (Cursor{0, 3}));
  assert(b.move_cursor(Direction::Right) == (Cursor{0, 5}));
  // down keeps the screen column: column 4 of "naïve" is 'e' at byte 5
  assert(b.move_cursor(Direction::Down) == (Cursor{1, 5}));
  b.set_cursor(Cursor{1, 3});
  assert(b.cursor() == (Cursor{1, 2}));

  b.set_cursor(Cursor{0, 5});
  Cursor c = b.delete_backward(b.cursor());
  assert(c == (Cursor{0, 3}));
  assert(b.line(0) == "caf");
  c = b.insert_char(c, '\xc3');
  c = b.insert_char(c, '\xa8');
  assert(b.line(0) == "caf\xc3\xa8");
  assert(c == (Cursor{0, 5}));
}

static void test_backspace_then_save_reloads() {
  auto dir = scratch_dir();
  auto p = dir / "cafe.txt";
  {
    std::ofstream o(p, std::ios::binary);
    o << "caf\xc3\xa9\n";
  }
  std::string msg;
  bool ok = false;
  TextBuffer b = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  b.move_cursor(Direction::End);
  b.delete_backward(b.cursor());
  assert(b.write_file(p, msg));
  assert(slurp(p) == "caf\n");
  TextBuffer again = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(again.line(0) == "caf");
  std::filesystem::remove_all(dir);
}

int main() {
  test_insert_and_split();
  test_insert_clamps_and_appends();
  test_delete_backward();
  test_join_lines();
  test_move_cursor();
  test_replay_matches_model();
  test_load_records_terminators();
  test_decode_error_fails_load();
  test_stream_round_trip();
  test_file_round_trip_and_failure();
  test_multibyte_editing();
  test_backspace_then_save_reloads();
  return 0;
}
