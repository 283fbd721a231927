#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main, draw the first screen, then enable_raw();
 *        the destructor releases raw mode, clears the screen and restores
 *        the cursor on every exit path.
 * Note: manages terminal modes (raw/noecho/keypad), not rendering.
 */

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  void enable_raw();

private:
  bool raw_ = false;
  int saved_cursor_ = 1;
};
