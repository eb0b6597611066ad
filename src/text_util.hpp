#pragma once
/*
 * TextUtil
 *
 * Purpose: string helpers shared by the buffer, renderer, prompt and rc parser.
 * Note: positions in a line are byte offsets; a screen column is one code
 *       point. Wide glyph widths are not modelled.
 */
#include <cstddef>
#include <string>
#include <string_view>

std::string trim(std::string_view s);

inline bool is_utf8_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Byte offset of the next / previous code point boundary.
size_t utf8_next(std::string_view s, size_t off);
size_t utf8_prev(std::string_view s, size_t off);
// Start of the code point that contains off.
size_t utf8_floor(std::string_view s, size_t off);

// Malformed or truncated sequences decode as '?' and consume one byte.
char32_t utf8_decode(std::string_view s, size_t off, size_t& len);
void utf8_append(std::string& out, char32_t cp);

// Code points in s[0, off).
int utf8_column(std::string_view s, size_t off);
// Byte offset of column col; s.size() past the end.
size_t utf8_offset(std::string_view s, int col);
