#pragma once
/*
 * Settings
 *
 * Purpose: user preferences and the rc file (~/.mnanorc) that sets them.
 * Format: one command per line ("set number on"); '#' or '"' start comments.
 */
#include <optional>
#include <string>
#include <filesystem>
#include "types.hpp"

struct Settings {
  bool show_line_numbers = false;
  bool show_helpbar = true;
  bool collapse_repeats = true;
  LineEnding new_file_ending = LineEnding::LF;
};

// $MNANO_RC if set, else $HOME/.mnanorc; nullopt when neither is available.
std::optional<std::filesystem::path> default_rc_path();

// Applies one rc line; false with msg when it is not understood.
bool apply_rc_line(Settings& s, const std::string& line, std::string& msg);

// A missing file is not an error. Bad lines are skipped; the last error is
// reported through msg and the result is false.
bool load_rc(const std::filesystem::path& path, Settings& s, std::string& msg);
