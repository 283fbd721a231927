#include "tracker.hpp"
#include "headless_terminal.hpp"
#include "renderer.hpp"
#include "utf8.hpp"
#include <cassert>
#include <string>
#include <vector>

static const int ROWS = 30;
static const int COLS = 80;

static std::vector<FoodRecord> sample_catalog() {
  return {
    {"Egg", 70.0, 1.0, 5.0, 6.0, "each"},
    {"Rice", 130.0, 28.0, 0.3, 2.7, "100 g"},
  };
}

static bool feed(Tracker& t, const Event& ev) { return t.handle_event(ev); }

static void type(Tracker& t, const std::string& s) {
  for (const auto& g : utf8_split(s)) t.handle_event(Event::glyph(g));
}

static void expect_cursor_at(const HeadlessTerminal& term, int field, int typed) {
  Point origin = form_layout(COLS, ROWS).text[field];
  assert(term.cursor_row() == origin.y);
  assert(term.cursor_col() == origin.x + typed);
}

static void test_overview_screen() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  assert(t.view() == View::Overview);
  assert(t.catalog().size() == 2);
  assert(t.catalog()[1].name == "Rice");
  assert(!term.cursor_visible());
  assert(term.cell(0, 0) == "┌");
  assert(term.cell(0, COLS - 1) == "┐");
  assert(term.cell(ROWS - 3, 0) == "└");
  assert(term.cell(ROWS - 3, COLS - 1) == "┘");
  assert(term.find("q Quit").y == ROWS - 2);
  assert(term.find("q Quit").x == 1);
  assert(term.find("a Add Food").x == 1 + 6 + 5);
  assert(term.contains("Today:"));
  assert(term.contains("Calories: 0 Protein: 0 Carbs: 0 Fat: 0"));
  assert(term.contains("2 foods in catalog"));
}

static void test_quit_only_from_overview() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  assert(feed(t, Event::glyph("a")));
  assert(t.view() == View::FormEntry);
  assert(feed(t, Event::glyph("q")));
  assert(t.view() == View::FormEntry);
  assert(t.form().field(0) == "q");
  assert(feed(t, Event::key_of(Key::Esc)));
  assert(t.view() == View::Overview);
  assert(!feed(t, Event::glyph("q")));
}

static void test_form_screen() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  assert(term.cursor_visible());
  assert(term.contains("Food Name:"));
  assert(term.contains(" Quantity:"));
  assert(term.contains("Esc Cancel"));
  FormLayout l = form_layout(COLS, ROWS);
  for (int i = 0; i < kFormFieldCount; ++i) {
    assert(term.cell(l.text[i].y - 1, l.text[i].x - 1) == "┌");
    assert(term.cell(l.text[i].y, l.text[i].x - 1) == "│");
    assert(term.cell(l.text[i].y + 1, l.text[i].x - 1) == "└");
  }
  expect_cursor_at(term, 0, 0);
}

static void test_typing_echoes_and_moves_cursor() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  type(t, "Café");
  assert(t.form().field(0) == "Café");
  assert(term.contains("Café"));
  expect_cursor_at(term, 0, 4);

  feed(t, Event::key_of(Key::Backspace));
  assert(t.form().field(0) == "Caf");
  assert(!term.contains("Café"));
  expect_cursor_at(term, 0, 3);
}

static void test_backspace_on_empty_field() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  feed(t, Event::key_of(Key::Backspace));
  feed(t, Event::key_of(Key::Backspace));
  assert(t.form().typed() == 0);
  expect_cursor_at(term, 0, 0);
  Point origin = form_layout(COLS, ROWS).text[0];
  assert(term.cell(origin.y, origin.x - 1) == "│");
  type(t, "ab");
  expect_cursor_at(term, 0, 2);
}

static void test_tab_bounds() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  feed(t, Event::key_of(Key::BackTab));
  assert(t.form().active() == 0);
  expect_cursor_at(term, 0, 0);
  for (int i = 0; i < 10; ++i) feed(t, Event::key_of(Key::Tab));
  assert(t.form().active() == kFormFieldCount - 1);
  expect_cursor_at(term, kFormFieldCount - 1, 0);
}

static void test_ledger_reset_on_field_change() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  type(t, "abc");
  expect_cursor_at(term, 0, 3);
  feed(t, Event::key_of(Key::Tab));
  expect_cursor_at(term, 1, 0);
  type(t, "x");
  expect_cursor_at(term, 1, 1);
  feed(t, Event::key_of(Key::BackTab));
  expect_cursor_at(term, 0, 3);
  feed(t, Event::key_of(Key::Tab));
  expect_cursor_at(term, 1, 1);
  type(t, "y");
  assert(t.form().field(1) == "xy");
  assert(t.form().field(0) == "abc");
}

static void fill_form(Tracker& t, const std::vector<std::string>& values) {
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) feed(t, Event::key_of(Key::Tab));
    type(t, values[i]);
  }
}

static void test_submit_adds_scaled_food() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  // name, calories, protein, carbs, fat, unit, quantity
  fill_form(t, {"Egg", "70", "6", "1", "5", "each", "2"});
  feed(t, Event::key_of(Key::Enter));
  assert(t.view() == View::Overview);
  assert(t.last_error().empty());
  assert(t.totals().calories() == 140.0);
  assert(t.totals().carbs() == 2.0);
  assert(t.totals().fat() == 10.0);
  assert(t.totals().protein() == 12.0);
  assert(term.contains("Calories: 140 Protein: 12 Carbs: 2 Fat: 10"));
  assert(!term.cursor_visible());
}

static void test_bad_quantity_is_discarded() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  fill_form(t, {"Egg", "70", "6", "1", "5", "each", "two"});
  feed(t, Event::key_of(Key::Enter));
  assert(t.view() == View::Overview);
  assert(t.last_error() == "invalid quantity: 'two'");
  assert(t.totals().calories() == 0.0);
  assert(t.totals().protein() == 0.0);
  assert(term.contains("Calories: 0 Protein: 0 Carbs: 0 Fat: 0"));
}

static void test_escape_cancels_and_form_starts_empty() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  fill_form(t, {"Egg", "70", "6", "1", "5", "each", "2"});
  feed(t, Event::key_of(Key::Esc));
  assert(t.view() == View::Overview);
  assert(t.totals().calories() == 0.0);
  feed(t, Event::glyph("a"));
  assert(t.form().active() == 0);
  for (int i = 0; i < kFormFieldCount; ++i) assert(t.form().field(i).empty());
  assert(!term.contains("Egg"));
  expect_cursor_at(term, 0, 0);
}

static void test_overview_ignores_other_keys() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  assert(feed(t, Event::glyph("x")));
  assert(feed(t, Event::key_of(Key::Tab)));
  assert(feed(t, Event::key_of(Key::Enter)));
  Event mouse;
  mouse.type = EventType::Mouse;
  assert(feed(t, mouse));
  Event paste;
  paste.type = EventType::Paste;
  paste.text = "q";
  assert(feed(t, paste));
  assert(t.view() == View::Overview);
}

static void test_resize_redraws_active_screen() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  feed(t, Event::glyph("a"));
  type(t, "Rice");
  feed(t, Event::key_of(Key::Tab));
  type(t, "13");

  const int rows = 40, cols = 100;
  term.resize(rows, cols);
  feed(t, term.read_event());
  assert(t.view() == View::FormEntry);
  assert(term.cell(0, cols - 1) == "┐");
  assert(term.cell(rows - 3, 0) == "└");
  assert(term.contains("Rice"));
  assert(term.contains("13"));
  Point origin = form_layout(cols, rows).text[1];
  assert(term.cursor_row() == origin.y);
  assert(term.cursor_col() == origin.x + 2);

  feed(t, Event::key_of(Key::Esc));
  term.resize(ROWS, COLS);
  feed(t, term.read_event());
  assert(term.contains("Today:"));
  assert(term.cell(ROWS - 3, COLS - 1) == "┘");
}

static void test_run_until_quit() {
  HeadlessTerminal term(ROWS, COLS);
  Tracker t(term, sample_catalog());
  t.start();
  term.push(Event::glyph("a"));
  term.push_text("Rice");
  term.push(Event::key_of(Key::Tab));
  term.push_text("130");
  term.push(Event::key_of(Key::Tab));
  term.push_text("2.7");
  term.push(Event::key_of(Key::Tab));
  term.push_text("28");
  term.push(Event::key_of(Key::Tab));
  term.push_text("0.3");
  term.push(Event::key_of(Key::Tab));
  term.push_text("100 g");
  term.push(Event::key_of(Key::Tab));
  term.push_text("1.5");
  term.push(Event::key_of(Key::Enter));
  term.push(Event::glyph("q"));
  t.run();
  assert(term.pending_events() == 0);
  assert(t.totals().calories() == 195.0);
  assert(t.totals().carbs() == 42.0);
  assert(term.contains("Calories: 195 Protein: 4 Carbs: 42 Fat: 0"));
}

int main() {
  test_overview_screen();
  test_quit_only_from_overview();
  test_form_screen();
  test_typing_echoes_and_moves_cursor();
  test_backspace_on_empty_field();
  test_tab_bounds();
  test_ledger_reset_on_field_change();
  test_submit_adds_scaled_food();
  test_bad_quantity_is_discarded();
  test_escape_cancels_and_form_starts_empty();
  test_overview_ignores_other_keys();
  test_resize_redraws_active_screen();
  test_run_until_quit();
  return 0;
}
