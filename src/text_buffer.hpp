#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer owning content, cursor and modified flag.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename); the
 *          terminator convention seen on load is reused on save.
 * Note: cursor is index based (row, byte column); edits return the new cursor.
 */
#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include <filesystem>
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer();

  bool empty() const;
  int line_count() const;
  const std::string& line(int r) const;
  std::string text() const;
  void init_from_lines(std::vector<std::string> lines);

  const Cursor& cursor() const { return cursor_; }
  void set_cursor(Cursor c) { cursor_ = clamp(c); }
  Cursor clamp(Cursor c) const;

  bool modified() const { return modified_; }
  LineEnding line_ending() const { return ending_; }
  void set_line_ending(LineEnding e) { ending_ = e; }
  bool final_newline() const { return final_newline_; }

  Cursor insert_char(Cursor pos, char ch);
  Cursor insert_newline(Cursor pos);
  Cursor delete_backward(Cursor pos);
  // page is the row count PageUp/PageDown travel.
  Cursor move_cursor(Direction dir, int page = 1);

  static bool from_stream(std::istream& in, TextBuffer& out, std::string& msg);
  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_stream(std::ostream& out, std::string& msg);
  bool write_file(const std::filesystem::path& path, std::string& msg);

private:
  void serialize(std::string& out) const;

  std::vector<std::string> lines_;
  Cursor cursor_{};
  bool modified_ = false;
  LineEnding ending_ = LineEnding::LF;
  bool final_newline_ = false;
};
