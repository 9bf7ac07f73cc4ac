#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>

// One parsed script line. Kinds map to the command codes of the input format:
//   1 <text>  Append
//   2 <n>     Delete n trailing characters
//   3 <i>     Print the character at 1-based index i
//   4         Undo the latest Append or Delete
// Anything else is Invalid, which is kept in the sequence but never applied.
enum class OpKind { Append, Delete, Print, Undo, Invalid };

struct Operation {
  OpKind kind = OpKind::Invalid;

  // Append payload. Non-owning, points into the script the op was parsed from.
  std::string_view text;
  // Delete count or Print index.
  size_t value = 0;

  Operation() = default;

  static Operation append(std::string_view text) { return Operation(OpKind::Append, text, 0); }
  static Operation del(size_t count) { return Operation(OpKind::Delete, {}, count); }
  static Operation print(size_t index) { return Operation(OpKind::Print, {}, index); }
  static Operation undo() { return Operation(OpKind::Undo, {}, 0); }
  static Operation invalid() { return Operation(); }

  bool isValid() const { return kind != OpKind::Invalid; }
  bool mutates() const { return kind == OpKind::Append || kind == OpKind::Delete; }

  bool operator==(const Operation& other) const;
  bool operator!=(const Operation& other) const {
    return !(*this == other);
  }

  friend std::ostream& operator<<(std::ostream& os, const Operation& op);

private:
  Operation(OpKind k, std::string_view t, size_t v) : kind(k), text(t), value(v) {}
};

const char* opKindName(OpKind kind);

std::ostream& operator<<(std::ostream& os, OpKind kind);
