#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include "settings.hpp"
#include "config.hpp"
#include <iostream>
#include <optional>
#include <filesystem>
#include <string>

static void usage(std::ostream& os) {
  os << "usage: " << MNANO_NAME << " [filename] [-l|--line-numbers]\n"
     << "  -l, --line-numbers  show line numbers\n"
     << "  -h, --help          show this help\n"
     << "  -V, --version       show version\n";
}

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  bool line_numbers = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-l" || a == "--line-numbers") { line_numbers = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    if (a == "-V" || a == "--version") { std::cout << MNANO_NAME << " " << MNANO_VERSION << "\n"; return 0; }
    if (a.size() > 1 && a[0] == '-') { std::cerr << MNANO_NAME << ": unknown option " << a << "\n"; usage(std::cerr); return 2; }
    if (path) { std::cerr << MNANO_NAME << ": only one file can be edited\n"; usage(std::cerr); return 2; }
    path = std::filesystem::path(a);
  }

  EditorState st;
  std::string rc_msg;
  bool rc_ok = true;
  if (auto rc = default_rc_path()) rc_ok = load_rc(*rc, st.settings, rc_msg);
  if (line_numbers) st.settings.show_line_numbers = true;
  st.buf.set_line_ending(st.settings.new_file_ending);
  if (path) {
    std::string msg;
    if (!open_into(st, *path, msg)) {
      std::cerr << MNANO_NAME << ": " << msg << "\n";
      return 1;
    }
  }
  if (!rc_ok) st.message = rc_msg;

  int code = 0;
  {
    Terminal session;
    NcursesTerminal term;
    Editor ed(term, std::move(st));
    code = ed.run();
  }
  if (code != 0) std::cerr << MNANO_NAME << ": input closed\n";
  return code;
}
