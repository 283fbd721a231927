#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (View/Event/Point).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string>
#include <utility>

enum class View { Overview, FormEntry };

struct Point { int x = 0; int y = 0; };

enum class EventType { Key, Resize, Focus, Paste, Mouse };

enum class Key { None, Char, Tab, BackTab, Enter, Backspace, Esc };

struct Event {
  EventType type = EventType::Key;
  Key key = Key::None;
  std::string text; // one UTF-8 glyph for Key::Char, pasted text for Paste
  int cols = 0;     // Resize only
  int rows = 0;

  static Event key_of(Key k) { Event e; e.key = k; return e; }
  static Event glyph(std::string s) { Event e; e.key = Key::Char; e.text = std::move(s); return e; }
  static Event resize(int c, int r) { Event e; e.type = EventType::Resize; e.cols = c; e.rows = r; return e; }
};
