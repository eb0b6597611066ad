#include "settings.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static void test_apply_rc_line() {
  Settings s;
  std::string msg;
  assert(apply_rc_line(s, "set number on", msg));
  assert(s.show_line_numbers);
  assert(msg == "number on");
  assert(apply_rc_line(s, "  :set number off  ", msg));
  assert(!s.show_line_numbers);
  assert(apply_rc_line(s, "set number", msg));
  assert(s.show_line_numbers);

  assert(apply_rc_line(s, "set helpbar off", msg));
  assert(!s.show_helpbar);
  assert(apply_rc_line(s, "set collapse off", msg));
  assert(!s.collapse_repeats);
  assert(apply_rc_line(s, "set newline crlf", msg));
  assert(s.new_file_ending == LineEnding::CRLF);

  // comments and blank lines are accepted and change nothing
  Settings before = s;
  assert(apply_rc_line(s, "# set number off", msg));
  assert(apply_rc_line(s, "\" vim style comment", msg));
  assert(apply_rc_line(s, "   ", msg));
  assert(s.show_line_numbers == before.show_line_numbers);
}

static void test_rejects_bad_lines() {
  Settings s;
  std::string msg;
  assert(!apply_rc_line(s, "bogus", msg));
  assert(msg == "unknown command: bogus");
  assert(!apply_rc_line(s, "set number maybe", msg));
  assert(!s.show_line_numbers);
  assert(!apply_rc_line(s, "set newline cr", msg));
  assert(s.new_file_ending == LineEnding::LF);
}

static void test_load_rc() {
  auto dir = std::filesystem::temp_directory_path() / ("mnano_rc_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  Settings s;
  std::string msg;
  assert(load_rc(dir / "missing", s, msg));

  auto rc = dir / "rc";
  {
    std::ofstream o(rc, std::ios::binary);
    o << "# mnano settings\nset number on\nfrobnicate\nset helpbar off\n";
  }
  assert(!load_rc(rc, s, msg));
  assert(msg == "rc:3: unknown command: frobnicate");
  // good lines around the bad one still apply
  assert(s.show_line_numbers);
  assert(!s.show_helpbar);
  std::filesystem::remove_all(dir);
}

static void test_default_rc_path() {
  ::setenv("MNANO_RC", "/tmp/custom_rc", 1);
  auto p = default_rc_path();
  assert(p && *p == std::filesystem::path("/tmp/custom_rc"));
  ::unsetenv("MNANO_RC");
  ::setenv("HOME", "/home/someone", 1);
  p = default_rc_path();
  assert(p && *p == std::filesystem::path("/home/someone") / ".mnanorc");
}

int main() {
  test_apply_rc_line();
  test_rejects_bad_lines();
  test_load_rc();
  test_default_rc_path();
  return 0;
}
