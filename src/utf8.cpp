#include "utf8.hpp"

static inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

static size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

// length of the glyph starting at i, clamped to the bytes that really continue it
static size_t glyph_at(std::string_view s, size_t i) {
  size_t want = sequence_length(static_cast<unsigned char>(s[i]));
  size_t n = 1;
  while (n < want && i + n < s.size() && is_continuation(static_cast<unsigned char>(s[i + n]))) n++;
  return n;
}

size_t utf8_length(std::string_view s) {
  size_t count = 0;
  for (size_t i = 0; i < s.size(); i += glyph_at(s, i)) count++;
  return count;
}

void utf8_pop_back(std::string& s) {
  if (s.empty()) return;
  size_t i = 0, last = 0;
  while (i < s.size()) { last = i; i += glyph_at(s, i); }
  s.erase(last);
}

std::vector<std::string> utf8_split(std::string_view s) {
  std::vector<std::string> out;
  for (size_t i = 0; i < s.size();) {
    size_t n = glyph_at(s, i);
    out.emplace_back(s.substr(i, n));
    i += n;
  }
  return out;
}

std::string utf8_prefix(std::string_view s, size_t n) {
  size_t i = 0;
  while (i < s.size() && n > 0) { i += glyph_at(s, i); n--; }
  return std::string(s.substr(0, i));
}
