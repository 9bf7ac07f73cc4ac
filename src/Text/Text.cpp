#include "Text.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include "Utils/Debug.h"
#include "Utils/Utf8.h"

using namespace std;

Text::Text(string init, size_t declaredCount, EngineLimits limits)
    : value_(std::move(init)), declaredCount_(declaredCount), limits_(limits) {
  appendCharStarts(charStarts_, value_, 0);
}

void Text::ensureOpen(const char* what) const {
  if (consumed_) {
    throw runtime_error(string(what) + " called on a Text whose output was already taken");
  }
}

void Text::apply(const vector<Operation>& ops, ostream& out) {
  ensureOpen("apply");

  if (ops.size() > limits_.maxOps) {
    throw runtime_error(
      "The input exceeds the max number of operations permitted. (" +
      to_string(limits_.maxOps) + ")");
  }
  if (ops.size() != declaredCount_) {
    throw runtime_error(
      "The provided count doesn't match the number of operations parsed. (count = " +
      to_string(declaredCount_) + ", operations = " + to_string(ops.size()) + ")");
  }

  size_t deletedTotal = 0;
  for (const Operation& op : ops) {
    switch (op.kind) {
      case OpKind::Append:
        applyAppend(op.text);
        break;

      case OpKind::Delete:
        if (op.value > length()) {
          debug("skip", op, "buffer length", length());
          break;
        }
        // Checked before mutating, so a failing Delete leaves the buffer as is.
        deletedTotal += op.value;
        if (deletedTotal > limits_.maxDeletedChars) {
          throw runtime_error(
            "The input exceeds the max number of characters which can be deleted. (" +
            to_string(limits_.maxDeletedChars) + ")");
        }
        applyDelete(op.value);
        break;

      case OpKind::Print:
        applyPrint(op.value, out);
        break;

      case OpKind::Undo:
        applyUndo();
        break;

      case OpKind::Invalid:
        break;
    }
  }
}

void Text::applyAppend(string_view text) {
  size_t before = charStarts_.size();
  appendCharStarts(charStarts_, text, value_.size());
  value_.append(text);
  history_.push_back(UndoEntry::undoAppend(charStarts_.size() - before));
}

void Text::truncateChars(size_t n) {
  size_t keep = charStarts_.size() - n;
  size_t bytes = keep < charStarts_.size() ? charStarts_[keep] : value_.size();
  value_.resize(bytes);
  charStarts_.resize(keep);
}

void Text::applyDelete(size_t n) {
  size_t keep = charStarts_.size() - n;
  size_t bytes = keep < charStarts_.size() ? charStarts_[keep] : value_.size();

  // Popped from the back, so `removed` ends up last-character-first. Reversal
  // is left to applyUndo since most deletes are never undone.
  string removed(value_.rbegin(), value_.rbegin() + static_cast<ptrdiff_t>(value_.size() - bytes));
  vector<size_t> starts(charStarts_.begin() + static_cast<ptrdiff_t>(keep), charStarts_.end());

  truncateChars(n);
  history_.push_back(UndoEntry::undoDelete(std::move(removed), std::move(starts)));
}

void Text::applyPrint(size_t index, ostream& out) const {
  // Reads the buffer as it is now, not as it was at any earlier point.
  if (index == 0 || index > length()) {
    debug("skip Print", index, "buffer length", length());
    return;
  }
  size_t begin = charStarts_[index - 1];
  size_t end = index < charStarts_.size() ? charStarts_[index] : value_.size();
  out << string_view(value_).substr(begin, end - begin) << '\n';
}

void Text::applyUndo() {
  if (history_.empty()) {
    debug("skip Undo: history empty");
    return;
  }

  UndoEntry entry = std::move(history_.back());
  history_.pop_back();

  switch (entry.kind) {
    case UndoEntry::Kind::UndoAppend:
      truncateChars(min(entry.count, length()));
      debug("undo Append", entry.count);
      break;
    case UndoEntry::Kind::UndoDelete:
      reverse(entry.removed.begin(), entry.removed.end());
      value_.append(entry.removed);
      charStarts_.insert(charStarts_.end(), entry.charStarts.begin(), entry.charStarts.end());
      debug("undo Delete", entry.count);
      break;
  }
}

string Text::output() {
  ensureOpen("output");
  consumed_ = true;
  history_.clear();
  charStarts_.clear();
  return std::move(value_);
}
