#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1
#endif
// clear()/refresh()/move() must stay method names, not curses macros
#define NCURSES_NOMACROS 1
#include "ncurses_terminal.hpp"
#include "input.hpp"
#include <ncurses.h>
#include <cerrno>
#include <stdexcept>

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { werase(stdscr); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  // addstr reports ERR for output clipped at the edge; callers clip beforehand,
  // drawing problems then surface on the next refresh
  (void)mvwaddnstr(stdscr, row, col, text.c_str(), static_cast<int>(text.size()));
}

void NcursesTerminal::move_cursor(int row, int col) { wmove(stdscr, row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() {
  if (wrefresh(stdscr) == ERR) throw std::runtime_error("terminal refresh failed");
}

Event NcursesTerminal::read_event() {
  while (true) {
    wint_t wch = 0;
    errno = 0;
    int rc = wget_wch(stdscr, &wch);
    if (rc == ERR) {
      if (errno == EINTR) continue;
      throw std::runtime_error("terminal read failed");
    }
    Event ev = translate_input(rc, wch);
    if (ev.type == EventType::Resize) {
      int r, c; getmaxyx(stdscr, r, c);
      ev.cols = c;
      ev.rows = r;
    }
    return ev;
  }
}
