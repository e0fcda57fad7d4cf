#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal(int esc_delay_ms) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  set_escdelay(esc_delay_ms);
  // a block cursor reads better on a hex cell
  saved_cursor_ = curs_set(2);
  if (saved_cursor_ == ERR) saved_cursor_ = curs_set(1);
}

Terminal::~Terminal() {
  if (saved_cursor_ != ERR) curs_set(saved_cursor_);
  endwin();
}
