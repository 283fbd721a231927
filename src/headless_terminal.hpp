#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records: one UTF-8 glyph per cell, cursor position/visibility, refresh count.
 * Input: replays events queued with push(); read_event on an empty queue throws.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visible(bool visible) override;
  void refresh() override;
  Event read_event() override;

  void push(Event ev);
  void push_text(const std::string& s); // one Key::Char event per glyph
  // changes the grid size and queues the matching resize event
  void resize(int rows, int cols);

  const std::string& cell(int row, int col) const;
  std::string row_text(int row) const;
  // first occurrence of text on screen, {-1,-1} when absent
  Point find(const std::string& text) const;
  bool contains(const std::string& text) const { return find(text).x >= 0; }

  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refresh_count() const { return refreshes_; }
  size_t pending_events() const { return events_.size(); }

private:
  int rows_;
  int cols_;
  std::vector<std::vector<std::string>> cells_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  bool cursor_visible_ = true;
  int refreshes_ = 0;
  std::deque<Event> events_;
};
