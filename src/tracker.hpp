#pragma once
/*
 * Tracker
 *
 * Purpose: owns the screen state (view, form, totals, catalog) and turns
 *          terminal events into state transitions and canvas calls.
 * Loop: run() blocks on one event at a time; each handler, including its
 *       drawing and flush, completes before the next read.
 * Views: Overview accepts q/a; FormEntry accepts glyphs, Tab/S-Tab,
 *        Backspace, Enter (submit) and Esc (cancel).
 */
#include <string>
#include <vector>
#include "canvas.hpp"
#include "food.hpp"
#include "form.hpp"
#include "iterminal.hpp"
#include "macros.hpp"
#include "renderer.hpp"
#include "types.hpp"

class Tracker {
public:
  Tracker(ITerminal& terminal, std::vector<FoodRecord> catalog);

  void start();
  void run();
  // false once the quit key has been handled
  bool handle_event(const Event& ev);

  View view() const { return current_view; }
  const MacroTotals& totals() const { return today; }
  const FoodForm& form() const { return entry; }
  const std::vector<FoodRecord>& catalog() const { return foods; }
  // reason the last submission was rejected, empty after an accepted one
  const std::string& last_error() const { return last_err; }

private:
  void render();
  void enter_overview();
  void enter_form();
  void handle_overview_key(const Event& ev);
  void handle_form_key(const Event& ev);
  void handle_resize(int cols, int rows);
  void type_glyph(const std::string& glyph);
  void erase_glyph();
  void change_field(bool forward);
  void submit();
  void cancel();
  Point field_cursor() const;

  ITerminal& term;
  Canvas canvas;
  Renderer renderer;
  std::vector<FoodRecord> foods;
  MacroTotals today;
  FoodForm entry;
  View current_view = View::Overview;
  std::string last_err;
  bool should_quit = false;
};
