#include "tracker.hpp"
#include "log.hpp"
#include "utf8.hpp"
#include <utility>

Tracker::Tracker(ITerminal& terminal, std::vector<FoodRecord> catalog)
  : term(terminal), canvas(terminal), foods(std::move(catalog)) {}

void Tracker::start() { enter_overview(); }

void Tracker::run() {
  while (!should_quit) {
    handle_event(term.read_event());
  }
}

bool Tracker::handle_event(const Event& ev) {
  switch (ev.type) {
    case EventType::Resize:
      handle_resize(ev.cols, ev.rows);
      break;
    case EventType::Key:
      if (current_view == View::FormEntry) handle_form_key(ev);
      else handle_overview_key(ev);
      break;
    case EventType::Focus:
    case EventType::Paste:
    case EventType::Mouse:
      LOG_DEBUG("ignored event type {}", static_cast<int>(ev.type));
      break;
  }
  return !should_quit;
}

void Tracker::render() {
  if (current_view == View::FormEntry) renderer.render_form(canvas, entry);
  else renderer.render_overview(canvas, today, foods.size());
}

void Tracker::enter_overview() {
  current_view = View::Overview;
  LOG_DEBUG("view: overview");
  render();
}

void Tracker::enter_form() {
  current_view = View::FormEntry;
  entry.reset();
  LOG_DEBUG("view: form entry");
  render();
}

void Tracker::handle_resize(int cols, int rows) {
  LOG_DEBUG("resize to {}x{}", cols, rows);
  canvas.resize(cols, rows);
  render();
}

void Tracker::handle_overview_key(const Event& ev) {
  if (ev.key != Key::Char) return;
  // quit only here, so a 'q' typed into the form is just text
  if (ev.text == "q") { should_quit = true; return; }
  if (ev.text == "a") enter_form();
}

void Tracker::handle_form_key(const Event& ev) {
  switch (ev.key) {
    case Key::Char: type_glyph(ev.text); break;
    case Key::Backspace: erase_glyph(); break;
    case Key::Tab: change_field(true); break;
    case Key::BackTab: change_field(false); break;
    case Key::Enter: submit(); break;
    case Key::Esc: cancel(); break;
    case Key::None: break;
  }
}

Point Tracker::field_cursor() const {
  auto [cols, rows] = canvas.size();
  Point origin = form_layout(cols, rows).text[entry.active()];
  return {origin.x + static_cast<int>(entry.typed()), origin.y};
}

void Tracker::type_glyph(const std::string& glyph) {
  if (!entry.insert_text(glyph)) return;
  Point at = field_cursor();
  canvas.move_to(at.x - static_cast<int>(utf8_length(glyph)), at.y);
  canvas.write_text(glyph);
  canvas.flush();
}

void Tracker::erase_glyph() {
  if (!entry.backspace()) return;
  Point at = field_cursor();
  canvas.move_to(at.x + 1, at.y);
  canvas.erase_back();
  canvas.flush();
}

void Tracker::change_field(bool forward) {
  bool moved = forward ? entry.next_field() : entry.prev_field();
  if (!moved) return;
  Point at = field_cursor();
  canvas.move_to(at.x, at.y);
  canvas.flush();
}

void Tracker::submit() {
  FoodEntry e;
  std::string msg;
  if (parse_submission(entry.fields(), e, msg)) {
    today.add_scaled(e.food, e.quantity);
    last_err.clear();
    LOG_INFO("added {} x {} {}", e.quantity, e.food.name, e.food.unit);
  } else {
    last_err = msg;
    LOG_INFO("submission discarded: {}", msg);
  }
  entry.reset();
  enter_overview();
}

void Tracker::cancel() {
  entry.reset();
  enter_overview();
}
