#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: count/split/trim by code point so screen columns track glyphs, not bytes.
 * Note: malformed sequences are treated byte-by-byte (each stray byte is one glyph).
 */
#include <string>
#include <string_view>
#include <vector>

size_t utf8_length(std::string_view s);
void utf8_pop_back(std::string& s);
std::vector<std::string> utf8_split(std::string_view s);
std::string utf8_prefix(std::string_view s, size_t n);
