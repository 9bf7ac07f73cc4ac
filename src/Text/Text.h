#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "EngineLimits.h"
#include "Ops/Operation.h"
#include "Ops/UndoEntry.h"

// The character buffer that script operations run against, plus the stack of
// undo-eligible operations. Characters are UTF-8 code points: Delete, Print
// and the undo of an Append all count code points, never bytes.
//
// Lifecycle: construct, apply() (any number of times), then output() once.
// After output() the instance is consumed and every further apply()/output()
// throws.
class Text {
public:
  Text(std::string init, size_t declaredCount, EngineLimits limits = EngineLimits());

  // Runs `ops` serially. Prints go to `out`, one character per line.
  //
  // Throws std::runtime_error when ops.size() exceeds limits.maxOps, when it
  // differs from the declared count, or when the total removed by Deletes
  // would pass limits.maxDeletedChars. Nothing is rolled back: the buffer
  // keeps the state reached before the failing operation.
  void apply(const std::vector<Operation>& ops, std::ostream& out = std::cout);

  // Hands back the buffer and consumes this instance.
  std::string output();

  std::string_view value() const { return value_; }
  // In characters. value().size() is the byte length.
  size_t length() const { return charStarts_.size(); }
  size_t historySize() const { return history_.size(); }
  size_t declaredCount() const { return declaredCount_; }
  const EngineLimits& limits() const { return limits_; }
  bool isConsumed() const { return consumed_; }

private:
  void applyAppend(std::string_view text);
  // Requires n <= length().
  void applyDelete(size_t n);
  // Drops the last n characters (n <= length()) without touching history.
  void truncateChars(size_t n);
  void applyPrint(size_t index, std::ostream& out) const;
  void applyUndo();

  void ensureOpen(const char* what) const;

  std::string value_;
  // Byte offset of each character of value_, ascending.
  std::vector<size_t> charStarts_;
  size_t declaredCount_;
  EngineLimits limits_;
  std::vector<UndoEntry> history_;
  bool consumed_ = false;
};
