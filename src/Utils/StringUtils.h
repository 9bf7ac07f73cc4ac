#pragma once

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "Utf8.h"

// Escape special characters for readable display (newlines -> \n, etc.)
inline std::string makePrintable(std::string_view s) {
  std::string result;
  result.reserve(s.size() * 2);
  for (char c : s) {
    switch (c) {
      case '\n': result += "\\n"; break;
      case '\t': result += "\\t"; break;
      case '\r': result += "\\r"; break;
      case '\\': result += "\\\\"; break;
      default: result += c; break;
    }
  }
  return result;
}

// Trims Unicode whitespace (ASCII space, tab, U+00A0, U+3000, ...).
inline std::string_view trimStart(std::string_view s) {
  while (size_t w = whitespaceWidth(s)) s.remove_prefix(w);
  return s;
}

inline std::string_view trim(std::string_view s) {
  s = trimStart(s);
  while (size_t w = trailingWhitespaceWidth(s)) s.remove_suffix(w);
  return s;
}

// Strict unsigned parse: optional '+', then digits only, no surrounding
// whitespace. Empty input, stray characters and overflow all yield nullopt.
inline std::optional<size_t> parseUnsigned(std::string_view s) {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;

  size_t value = 0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return value;
}
