#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, input).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Coordinates: row/col in character cells, (0,0) is the top-left corner.
 */
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  // text must already fit on the row; callers clip
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual void refresh() = 0;
  // blocks until the next event
  virtual Event read_event() = 0;
};
