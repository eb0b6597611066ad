#include "ncurses_terminal.hpp"
#include <cerrno>
#include <string>
#include "text_util.hpp"

static constexpr short kAccentPair = 1;

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kAccentPair, COLOR_YELLOW, -1); // line numbers: default background
    } else {
      init_pair(kAccentPair, COLOR_YELLOW, COLOR_BLACK); // fallback
    }
    colors_ = true;
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

KeyEvent NcursesTerminal::translate(int ch) {
  switch (ch) {
    case KEY_RESIZE: return {KeyCode::Resize, 0, ModNone};
    case KEY_UP: return {KeyCode::Up, 0, ModNone};
    case KEY_DOWN: return {KeyCode::Down, 0, ModNone};
    case KEY_LEFT: return {KeyCode::Left, 0, ModNone};
    case KEY_RIGHT: return {KeyCode::Right, 0, ModNone};
    case KEY_HOME: return {KeyCode::Home, 0, ModNone};
    case KEY_END: return {KeyCode::End, 0, ModNone};
    case KEY_PPAGE: return {KeyCode::PageUp, 0, ModNone};
    case KEY_NPAGE: return {KeyCode::PageDown, 0, ModNone};
    case KEY_DC: return {KeyCode::Delete, 0, ModNone};
    case KEY_BACKSPACE: case 127: case 8: return {KeyCode::Backspace, 0, ModNone};
    case KEY_ENTER: case '\n': case '\r': return {KeyCode::Enter, 0, ModNone};
    case '\t': return {KeyCode::Tab, 0, ModNone};
    case 27: return {KeyCode::Escape, 0, ModNone};
    default: break;
  }
  if (ch >= 1 && ch <= 26) return {KeyCode::Char, 'a' + ch - 1, ModCtrl};
  if (ch >= 32 && ch <= 255) return {KeyCode::Char, ch, ModNone};
  return {KeyCode::Unknown, ch, ModNone};
}

bool NcursesTerminal::read_key(KeyEvent& out) {
  nodelay(stdscr, FALSE);
  int ch = ERR;
  do {
    errno = 0;
    ch = getch();
  } while (ch == ERR && errno == EINTR);
  if (ch == ERR) return false;
  out = translate(ch);
  return true;
}

bool NcursesTerminal::poll_key(KeyEvent& out) {
  nodelay(stdscr, TRUE);
  int ch = getch();
  nodelay(stdscr, FALSE);
  if (ch == ERR) return false;
  out = translate(ch);
  return true;
}

void NcursesTerminal::clear() { ::clear(); }

attr_t NcursesTerminal::to_curses(unsigned char attrs) const {
  attr_t a = A_NORMAL;
  if (attrs & AttrReverse) a |= A_REVERSE;
  if (attrs & AttrBold) a |= A_BOLD;
  if ((attrs & AttrAccent) && colors_) a |= COLOR_PAIR(kAccentPair);
  return a;
}

void NcursesTerminal::write_cell_run(int row, int col, const std::vector<Cell>& cells) {
  size_t i = 0;
  while (i < cells.size()) {
    unsigned char attrs = cells[i].attrs;
    std::string text;
    size_t j = i;
    while (j < cells.size() && cells[j].attrs == attrs) utf8_append(text, cells[j++].ch);
    attrset(to_curses(attrs));
    mvaddnstr(row, col + static_cast<int>(i), text.c_str(), static_cast<int>(text.size()));
    i = j;
  }
  attrset(A_NORMAL);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::flush() { ::refresh(); }
