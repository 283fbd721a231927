#include "headless_terminal.hpp"
#include "utf8.hpp"
#include <stdexcept>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  cells_.assign(rows_, std::vector<std::string>(cols_, " "));
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  for (auto& g : utf8_split(text)) {
    if (col >= cols_) break;
    if (col >= 0) cells_[row][col] = g;
    col++;
  }
}

void HeadlessTerminal::move_cursor(int row, int col) { cur_row_ = row; cur_col_ = col; }

void HeadlessTerminal::set_cursor_visible(bool visible) { cursor_visible_ = visible; }

void HeadlessTerminal::refresh() { refreshes_++; }

Event HeadlessTerminal::read_event() {
  if (events_.empty()) throw std::runtime_error("headless terminal: no scripted events left");
  Event ev = std::move(events_.front());
  events_.pop_front();
  return ev;
}

void HeadlessTerminal::push(Event ev) { events_.push_back(std::move(ev)); }

void HeadlessTerminal::push_text(const std::string& s) {
  for (auto& g : utf8_split(s)) push(Event::glyph(g));
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
  push(Event::resize(cols, rows));
}

const std::string& HeadlessTerminal::cell(int row, int col) const {
  static const std::string outside;
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return outside;
  return cells_[row][col];
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) return out;
  for (const auto& g : cells_[row]) out += g;
  return out;
}

Point HeadlessTerminal::find(const std::string& text) const {
  auto needle = utf8_split(text);
  if (needle.empty()) return {-1, -1};
  for (int r = 0; r < rows_; ++r) {
    for (int c = 0; c + static_cast<int>(needle.size()) <= cols_; ++c) {
      bool match = true;
      for (size_t k = 0; k < needle.size(); ++k) {
        if (cells_[r][c + static_cast<int>(k)] != needle[k]) { match = false; break; }
      }
      if (match) return {c, r};
    }
  }
  return {-1, -1};
}
