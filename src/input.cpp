#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1
#endif
#include "input.hpp"
#include <ncurses.h>
#include <climits>
#include <string>

static constexpr wint_t ESC = 27;

// multi-byte encoding follows the current LC_CTYPE, UTF-8 once the locale is set
static std::string encode_wide(wint_t wch) {
  char buf[MB_LEN_MAX];
  std::mbstate_t st{};
  size_t n = std::wcrtomb(buf, static_cast<wchar_t>(wch), &st);
  if (n == static_cast<size_t>(-1)) return std::string();
  return std::string(buf, n);
}

static Event translate_function_key(wint_t code) {
  switch (code) {
    case KEY_RESIZE: return Event::resize(0, 0);
    case KEY_BTAB: return Event::key_of(Key::BackTab);
    case KEY_BACKSPACE: return Event::key_of(Key::Backspace);
    case KEY_ENTER: return Event::key_of(Key::Enter);
    case KEY_MOUSE: { Event e; e.type = EventType::Mouse; return e; }
    default: return Event::key_of(Key::None);
  }
}

static Event translate_char(wint_t wch) {
  switch (wch) {
    case '\t': return Event::key_of(Key::Tab);
    case '\n': case '\r': return Event::key_of(Key::Enter);
    case ESC: return Event::key_of(Key::Esc);
    case 127: case 8: return Event::key_of(Key::Backspace);
    default: break;
  }
  if (wch < 32) return Event::key_of(Key::None);
  std::string s = encode_wide(wch);
  if (s.empty()) return Event::key_of(Key::None);
  return Event::glyph(std::move(s));
}

Event translate_input(int rc, wint_t wch) {
  if (rc == KEY_CODE_YES) return translate_function_key(wch);
  return translate_char(wch);
}
