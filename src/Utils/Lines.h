#pragma once

#include <string_view>
#include <vector>

// Split a script into lines without copying. Lines end at '\n', a trailing
// '\r' is dropped, and a final newline does not produce an empty last line.
// Views point into `text`, which must outlive them.
inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> result;
  size_t start = 0;
  while (start < text.size()) {
    size_t pos = text.find('\n', start);
    size_t end = (pos == std::string_view::npos) ? text.size() : pos;
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    result.push_back(line);
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return result;
}
