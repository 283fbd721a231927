#pragma once
/*
 * Canvas
 *
 * Purpose: drawing primitives over an ITerminal with a tracked write cursor
 *          (x = column, y = row, both in character cells).
 * Rendering: callers clear + redraw everything, then flush() once per logical
 *            redraw; flush() places the hardware cursor at the write cursor.
 */
#include <string>
#include "iterminal.hpp"
#include "types.hpp"

struct CanvasSize { int cols; int rows; };

class Canvas {
public:
  explicit Canvas(ITerminal& term);

  CanvasSize size() const { return {cols_, rows_}; }
  void resize(int cols, int rows);
  Point position() const { return pos_; }

  void clear();
  void move_to(int x, int y);
  void draw_rect(int x1, int y1, int x2, int y2);
  // returns code points written (not bytes); the write cursor advances by that much
  size_t write_text(const std::string& s);
  // blank the cell left of the write cursor and step back onto it
  void erase_back();
  void show_cursor();
  void hide_cursor();
  void flush();

private:
  void put(int x, int y, const std::string& s);

  ITerminal& term_;
  int cols_ = 0;
  int rows_ = 0;
  Point pos_;
};
