#include "utf8.hpp"
#include <cwchar>

static std::size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 0;
}

// Decodes the character starting at s[i]; sets used to the bytes it spans (1 when rejected).
static char32_t next_char(std::string_view s, std::size_t i, std::size_t& used) {
  unsigned char lead = static_cast<unsigned char>(s[i]);
  std::size_t n = sequence_length(lead);
  used = 1;
  if (n == 1) return lead;
  if (n == 0 || i + n > s.size()) return U'\uFFFD';

  char32_t cp = lead & (0xFF >> (n + 1));
  for (std::size_t k = 1; k < n; ++k) {
    unsigned char c = static_cast<unsigned char>(s[i + k]);
    if ((c >> 6) != 0x2) return U'\uFFFD';
    cp = (cp << 6) | (c & 0x3F);
  }
  used = n;
  return cp;
}

std::u32string utf8_decode(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());
  std::size_t used = 0;
  for (std::size_t i = 0; i < s.size(); i += used) out.push_back(next_char(s, i, used));
  return out;
}

std::string utf8_encode(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return out;
}

std::string utf8_encode(const std::u32string& s) {
  std::string out;
  for (char32_t cp : s) out += utf8_encode(cp);
  return out;
}

std::size_t utf8_length(std::string_view s) {
  std::size_t n = 0;
  std::size_t used = 0;
  for (std::size_t i = 0; i < s.size(); i += used, ++n) next_char(s, i, used);
  return n;
}

std::size_t utf8_byte_offset(std::string_view s, std::size_t char_index) {
  std::size_t seen = 0;
  std::size_t used = 0;
  for (std::size_t i = 0; i < s.size(); i += used, ++seen) {
    if (seen == char_index) return i;
    next_char(s, i, used);
  }
  return s.size();
}

std::string utf8_substr(std::string_view s, std::size_t first_char, std::size_t char_count) {
  std::size_t b = utf8_byte_offset(s, first_char);
  std::size_t e = utf8_byte_offset(s, first_char + char_count);
  return std::string(s.substr(b, e - b));
}

int utf8_char_width(char32_t cp) {
  if (cp < 0x80) return 1;
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  return w < 0 ? 1 : w;
}
