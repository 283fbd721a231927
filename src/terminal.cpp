#include "terminal.hpp"
#include "config.hpp"
#include <ncurses.h>
#include <locale.h>
#include <stdexcept>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  if (initscr() == nullptr) throw std::runtime_error("can not initialize terminal");
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(MT_ESC_DELAY_MS);
  int prev = curs_set(0);
  if (prev != ERR) saved_cursor_ = prev;
}

void Terminal::enable_raw() {
  if (raw_) return;
  if (raw() == ERR) throw std::runtime_error("can not enable raw mode");
  raw_ = true;
}

Terminal::~Terminal() {
  if (raw_) noraw();
  erase();
  refresh();
  curs_set(saved_cursor_);
  endwin();
}
