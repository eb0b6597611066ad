#include "text_util.hpp"
#include <cassert>
#include <string>

static void test_trim() {
  assert(trim("  a b \t\n") == "a b");
  assert(trim("") == "");
  assert(trim("   ") == "");
  assert(trim("x") == "x");
}

static void test_boundaries() {
  // "aé€𝄞b": 1 + 2 + 3 + 4 + 1 bytes
  const std::string s = "a\xc3\xa9\xe2\x82\xac\xf0\x9d\x84\x9e" "b";
  assert(utf8_next(s, 0) == 1);
  assert(utf8_next(s, 1) == 3);
  assert(utf8_next(s, 3) == 6);
  assert(utf8_next(s, 6) == 10);
  assert(utf8_next(s, 10) == 11);
  assert(utf8_next(s, 11) == 11);
  assert(utf8_prev(s, 11) == 10);
  assert(utf8_prev(s, 10) == 6);
  assert(utf8_prev(s, 6) == 3);
  assert(utf8_prev(s, 3) == 1);
  assert(utf8_prev(s, 0) == 0);
  assert(utf8_floor(s, 2) == 1);
  assert(utf8_floor(s, 8) == 6);
  assert(utf8_floor(s, 99) == s.size());
  assert(utf8_column(s, 6) == 3);
  assert(utf8_column(s, s.size()) == 5);
  assert(utf8_offset(s, 3) == 6);
  assert(utf8_offset(s, 40) == s.size());
}

static void test_decode_and_encode() {
  const std::string s = "\xe2\x82\xac";
  size_t len = 0;
  assert(utf8_decode(s, 0, len) == U'\u20AC' && len == 3);
  std::string out;
  utf8_append(out, U'\u20AC');
  utf8_append(out, U'\U0001D11E');
  utf8_append(out, U'z');
  assert(out == "\xe2\x82\xac\xf0\x9d\x84\x9e" "z");

  // truncated and stray bytes never swallow what follows
  const std::string bad = "\xe2\x82" "A";
  assert(utf8_decode(bad, 0, len) == U'?' && len == 1);
  assert(utf8_decode(bad, 2, len) == U'A' && len == 1);
}

int main() {
  test_trim();
  test_boundaries();
  test_decode_and_encode();
  return 0;
}
