#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncursesw for drawing and input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 * Errors: a failed refresh throws std::runtime_error; no retry.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visible(bool visible) override;
  void refresh() override;
  Event read_event() override;
};
