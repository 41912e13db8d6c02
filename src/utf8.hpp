#pragma once
/*
 * Utf8
 *
 * Purpose: minimal UTF-8 helpers for character-indexed text (decode/encode/width).
 * Note: every rejected byte decodes as one U+FFFD; length and offsets count characters the
 *       same way decode does. Widths come from wcwidth, unprintable counts 1.
 */
#include <cstddef>
#include <string>
#include <string_view>

std::u32string utf8_decode(std::string_view s);
std::string utf8_encode(char32_t cp);
std::string utf8_encode(const std::u32string& s);
std::size_t utf8_length(std::string_view s);
// Byte offset of the character at char_index (s.size() when past the end).
std::size_t utf8_byte_offset(std::string_view s, std::size_t char_index);
std::string utf8_substr(std::string_view s, std::size_t first_char, std::size_t char_count);
int utf8_char_width(char32_t cp);
