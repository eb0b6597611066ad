#include "text_util.hpp"
#include <cctype>

std::string trim(std::string_view s) {
  size_t i = 0; while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size(); while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) j--;
  return std::string(s.substr(i, j - i));
}

size_t utf8_next(std::string_view s, size_t off) {
  if (off >= s.size()) return s.size();
  off++;
  while (off < s.size() && is_utf8_continuation(static_cast<unsigned char>(s[off]))) off++;
  return off;
}

size_t utf8_prev(std::string_view s, size_t off) {
  if (off == 0) return 0;
  if (off > s.size()) off = s.size();
  off--;
  while (off > 0 && is_utf8_continuation(static_cast<unsigned char>(s[off]))) off--;
  return off;
}

size_t utf8_floor(std::string_view s, size_t off) {
  if (off >= s.size()) return s.size();
  while (off > 0 && is_utf8_continuation(static_cast<unsigned char>(s[off]))) off--;
  return off;
}

char32_t utf8_decode(std::string_view s, size_t off, size_t& len) {
  len = 1;
  unsigned char c = static_cast<unsigned char>(s[off]);
  if (c < 0x80) return c;
  size_t extra = 0;
  char32_t cp = 0;
  if (c >= 0xC2 && c <= 0xDF) { extra = 1; cp = c & 0x1F; }
  else if (c >= 0xE0 && c <= 0xEF) { extra = 2; cp = c & 0x0F; }
  else if (c >= 0xF0 && c <= 0xF4) { extra = 3; cp = c & 0x07; }
  else return U'?';
  if (off + extra >= s.size()) return U'?';
  for (size_t k = 1; k <= extra; ++k) {
    unsigned char cc = static_cast<unsigned char>(s[off + k]);
    if (!is_utf8_continuation(cc)) return U'?';
    cp = (cp << 6) | (cc & 0x3F);
  }
  len = extra + 1;
  return cp;
}

void utf8_append(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

int utf8_column(std::string_view s, size_t off) {
  if (off > s.size()) off = s.size();
  int col = 0;
  for (size_t i = 0; i < off; ++i)
    if (!is_utf8_continuation(static_cast<unsigned char>(s[i]))) col++;
  return col;
}

size_t utf8_offset(std::string_view s, int col) {
  size_t off = 0;
  for (int c = 0; c < col && off < s.size(); ++c) off = utf8_next(s, off);
  return off;
}
