#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// Inverse of an applied Append or Delete, pushed onto Text's history stack.
// Counts are in characters (UTF-8 code points).
struct UndoEntry {
  enum class Kind { UndoAppend, UndoDelete };

  Kind kind;
  // UndoAppend: number of characters to strip from the end of the buffer.
  size_t count = 0;
  // UndoDelete: removed bytes as popped off the buffer, so the last character
  // comes first. Put back in buffer order only when the entry is undone.
  std::string removed;
  // UndoDelete: buffer offsets where the removed characters started. The
  // buffer is back at its post-delete length whenever this entry is on top,
  // so the offsets are valid again at undo time.
  std::vector<size_t> charStarts;

  static UndoEntry undoAppend(size_t n) {
    return UndoEntry(Kind::UndoAppend, n, {}, {});
  }
  static UndoEntry undoDelete(std::string removedReversed, std::vector<size_t> starts) {
    size_t n = starts.size();
    return UndoEntry(Kind::UndoDelete, n, std::move(removedReversed), std::move(starts));
  }

private:
  UndoEntry(Kind k, size_t n, std::string r, std::vector<size_t> starts)
      : kind(k), count(n), removed(std::move(r)), charStarts(std::move(starts)) {}
};
