#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines, recording the
 *          terminator convention so it can be written back unchanged.
 * Usage: mmap_readlines(path, out, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>
#include "types.hpp"

struct SplitText {
  std::vector<std::string> lines;
  LineEnding ending = LineEnding::LF;
  bool final_newline = false;
};

bool is_valid_utf8(std::string_view data);

// Fails on invalid UTF-8; never substitutes bytes.
bool split_lines(std::string_view data, SplitText& out, std::string& msg);

bool mmap_readlines(const std::filesystem::path& path,
                    SplitText& out,
                    std::string& msg);
