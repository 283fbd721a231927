#pragma once
/*
 * Renderer
 *
 * Purpose: draw the overview and add-food screens onto a Canvas.
 * Constraint: stateless; receives snapshots from Tracker and always redraws
 *             the whole screen (clear, draw, one flush).
 */
#include <array>
#include <string>
#include <vector>
#include "canvas.hpp"
#include "form.hpp"
#include "macros.hpp"

struct FormLayout {
  int label_x = 0;
  // first text cell inside each field's box
  std::array<Point, kFormFieldCount> text{};
};

FormLayout form_layout(int cols, int rows);
std::string format_totals(const MacroTotals& t);

class Renderer {
public:
  void render_overview(Canvas& canvas, const MacroTotals& totals, size_t catalog_size);
  void render_form(Canvas& canvas, const FoodForm& form);

private:
  void draw_boundary(Canvas& canvas);
  void draw_help(Canvas& canvas, const std::vector<std::string>& labels);
  void draw_today(Canvas& canvas, const MacroTotals& totals, size_t catalog_size);
};
