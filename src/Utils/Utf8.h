#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

// Buffer characters are UTF-8 code points. Malformed input is not rejected:
// a stray continuation byte just stays attached to the character before it.

inline bool isContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte length of the code point starting at s[0] (0 for empty input).
inline size_t codePointWidth(std::string_view s) {
  if (s.empty()) return 0;
  size_t n = 1;
  while (n < s.size() && isContinuationByte(s[n])) n++;
  return n;
}

// Records where each character of `text` starts, as offsets from `base`.
// The first byte always starts a character, so a piece appended to a buffer
// never merges into the buffer's last character.
inline void appendCharStarts(std::vector<size_t>& starts, std::string_view text, size_t base) {
  for (size_t i = 0; i < text.size(); i++) {
    if (i == 0 || !isContinuationByte(text[i])) {
      starts.push_back(base + i);
    }
  }
}

// Byte length of the Unicode White_Space character at the front of `s`, 0 if
// there is none.
inline size_t whitespaceWidth(std::string_view s) {
  if (s.empty()) return 0;
  auto b = [&](size_t i) { return static_cast<unsigned char>(s[i]); };

  switch (b(0)) {
    case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
      return 1;
    case 0xC2:  // U+0085, U+00A0
      return s.size() >= 2 && (b(1) == 0x85 || b(1) == 0xA0) ? 2 : 0;
    case 0xE1:  // U+1680
      return s.size() >= 3 && b(1) == 0x9A && b(2) == 0x80 ? 3 : 0;
    case 0xE2:
      if (s.size() < 3) return 0;
      // U+2000..U+200A, U+2028, U+2029, U+202F
      if (b(1) == 0x80 &&
          ((b(2) >= 0x80 && b(2) <= 0x8A) || b(2) == 0xA8 || b(2) == 0xA9 || b(2) == 0xAF))
        return 3;
      // U+205F
      return b(1) == 0x81 && b(2) == 0x9F ? 3 : 0;
    case 0xE3:  // U+3000
      return s.size() >= 3 && b(1) == 0x80 && b(2) == 0x80 ? 3 : 0;
    default:
      return 0;
  }
}

// Same as whitespaceWidth, for the character at the back of `s`.
inline size_t trailingWhitespaceWidth(std::string_view s) {
  for (size_t len = 1; len <= 3 && len <= s.size(); len++) {
    if (whitespaceWidth(s.substr(s.size() - len)) == len) return len;
  }
  return 0;
}
