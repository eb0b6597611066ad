#include "terminal.hpp"
#include <locale.h>
#include "config.hpp"

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  // ^S/^Q and ^C reach the editor as keys
  raw();
  noecho();
  // keep Enter as '\r' so it is not confused with ^J
  nonl();
  keypad(stdscr, TRUE);
  set_escdelay(MNANO_ESC_DELAY_MS);
  curs_set(1);
}

Terminal::~Terminal() {
  endwin();
}
