#include "canvas.hpp"
#include "utf8.hpp"

static const char* const H_LINE = "─";
static const char* const V_LINE = "│";
static const char* const TOP_LEFT = "┌";
static const char* const TOP_RIGHT = "┐";
static const char* const BOTTOM_LEFT = "└";
static const char* const BOTTOM_RIGHT = "┘";

Canvas::Canvas(ITerminal& term) : term_(term) {
  TermSize sz = term_.getSize();
  cols_ = sz.cols;
  rows_ = sz.rows;
}

void Canvas::resize(int cols, int rows) {
  cols_ = cols;
  rows_ = rows;
}

void Canvas::clear() { term_.clear(); }

void Canvas::move_to(int x, int y) { pos_ = {x, y}; }

// clipped to the screen; the part left of column 0 is dropped glyph by glyph
void Canvas::put(int x, int y, const std::string& s) {
  if (y < 0 || y >= rows_ || x >= cols_) return;
  std::string text = s;
  if (x < 0) {
    auto glyphs = utf8_split(text);
    size_t skip = static_cast<size_t>(-x);
    if (skip >= glyphs.size()) return;
    text.clear();
    for (size_t i = skip; i < glyphs.size(); ++i) text += glyphs[i];
    x = 0;
  }
  size_t room = static_cast<size_t>(cols_ - x);
  if (utf8_length(text) > room) text = utf8_prefix(text, room);
  if (!text.empty()) term_.draw_text(y, x, text);
}

void Canvas::draw_rect(int x1, int y1, int x2, int y2) {
  for (int x = x1 + 1; x < x2; ++x) {
    put(x, y1, H_LINE);
    put(x, y2, H_LINE);
  }
  for (int y = y1 + 1; y < y2; ++y) {
    put(x1, y, V_LINE);
    put(x2, y, V_LINE);
  }
  put(x1, y1, TOP_LEFT);
  put(x2, y1, TOP_RIGHT);
  put(x1, y2, BOTTOM_LEFT);
  put(x2, y2, BOTTOM_RIGHT);
}

size_t Canvas::write_text(const std::string& s) {
  size_t n = utf8_length(s);
  put(pos_.x, pos_.y, s);
  pos_.x += static_cast<int>(n);
  return n;
}

void Canvas::erase_back() {
  pos_.x -= 1;
  put(pos_.x, pos_.y, " ");
}

void Canvas::show_cursor() { term_.set_cursor_visible(true); }

void Canvas::hide_cursor() { term_.set_cursor_visible(false); }

void Canvas::flush() {
  int row = pos_.y < 0 ? 0 : (pos_.y >= rows_ ? rows_ - 1 : pos_.y);
  int col = pos_.x < 0 ? 0 : (pos_.x >= cols_ ? cols_ - 1 : pos_.x);
  if (rows_ > 0 && cols_ > 0) term_.move_cursor(row, col);
  term_.refresh();
}
