#include "renderer.hpp"
#include "config.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <fmt/format.h>

FormLayout form_layout(int cols, int rows) {
  // label column + one space + box, centred; one label/box block per MT_FIELD_ROWS
  const int width = MT_LABEL_WIDTH + MT_INPUT_WIDTH + 1;
  const int height = MT_FIELD_ROWS * kFormFieldCount + 1;
  int x = std::max(1, cols / 2 - width / 2);
  int y = std::max(2, rows / 2 - height / 2);
  FormLayout l;
  l.label_x = x;
  for (int i = 0; i < kFormFieldCount; ++i) {
    l.text[i] = {x + MT_LABEL_WIDTH + 2, y + MT_FIELD_ROWS * i};
  }
  return l;
}

std::string format_totals(const MacroTotals& t) {
  return fmt::format("Calories: {:.0f} Protein: {:.0f} Carbs: {:.0f} Fat: {:.0f}",
                     t.calories(), t.protein(), t.carbs(), t.fat());
}

void Renderer::draw_boundary(Canvas& canvas) {
  auto [cols, rows] = canvas.size();
  canvas.draw_rect(0, 0, cols - 1, rows - MT_HELP_HEIGHT);
}

void Renderer::draw_help(Canvas& canvas, const std::vector<std::string>& labels) {
  int rows = canvas.size().rows;
  int n = 0;
  for (size_t i = 0; i < labels.size(); ++i) {
    canvas.move_to(1 + n + static_cast<int>(i) * MT_HELP_PAD, rows - MT_HELP_HEIGHT + 1);
    n += static_cast<int>(canvas.write_text(labels[i]));
  }
}

void Renderer::draw_today(Canvas& canvas, const MacroTotals& totals, size_t catalog_size) {
  auto [cols, rows] = canvas.size();
  std::string s = format_totals(totals);
  int x = cols / 2 - static_cast<int>(utf8_length(s)) / 2;
  int y = rows / 2;
  canvas.move_to(x, y);
  canvas.write_text("Today:");
  canvas.move_to(x, y + 1);
  canvas.write_text(s);
  std::string foods = fmt::format("{} foods in catalog", catalog_size);
  canvas.move_to(cols / 2 - static_cast<int>(utf8_length(foods)) / 2, y + 3);
  canvas.write_text(foods);
}

void Renderer::render_overview(Canvas& canvas, const MacroTotals& totals, size_t catalog_size) {
  canvas.hide_cursor();
  canvas.clear();
  draw_boundary(canvas);
  draw_help(canvas, {"q Quit", "a Add Food"});
  draw_today(canvas, totals, catalog_size);
  canvas.flush();
}

void Renderer::render_form(Canvas& canvas, const FoodForm& form) {
  auto [cols, rows] = canvas.size();
  canvas.clear();
  draw_boundary(canvas);
  draw_help(canvas, {"Tab Next", "S-Tab Prev", "Ret Submit", "Esc Cancel"});
  FormLayout l = form_layout(cols, rows);
  for (int i = 0; i < kFormFieldCount; ++i) {
    const Point& t = l.text[i];
    canvas.move_to(l.label_x, t.y);
    canvas.write_text(kFormLabels[i]);
    canvas.draw_rect(t.x - 1, t.y - 1, t.x - 1 + MT_INPUT_WIDTH, t.y + 1);
    canvas.move_to(t.x, t.y);
    canvas.write_text(form.field(i));
  }
  const Point& a = l.text[form.active()];
  canvas.move_to(a.x + static_cast<int>(form.typed()), a.y);
  canvas.show_cursor();
  canvas.flush();
}
