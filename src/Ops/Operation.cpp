#include "Operation.h"

#include "Utils/StringUtils.h"

using namespace std;

const char* opKindName(OpKind kind) {
  switch (kind) {
    case OpKind::Append:  return "Append";
    case OpKind::Delete:  return "Delete";
    case OpKind::Print:   return "Print";
    case OpKind::Undo:    return "Undo";
    case OpKind::Invalid: return "Invalid";
  }
  return "Unknown";
}

ostream& operator<<(ostream& os, OpKind kind) {
  return os << opKindName(kind);
}

// Payload fields that a kind does not use are ignored.
bool Operation::operator==(const Operation& other) const {
  if (kind != other.kind) return false;
  switch (kind) {
    case OpKind::Append:
      return text == other.text;
    case OpKind::Delete:
    case OpKind::Print:
      return value == other.value;
    case OpKind::Undo:
    case OpKind::Invalid:
      return true;
  }
  return false;
}

ostream& operator<<(ostream& os, const Operation& op) {
  os << op.kind;
  switch (op.kind) {
    case OpKind::Append:
      os << "(\"" << makePrintable(op.text) << "\")";
      break;
    case OpKind::Delete:
    case OpKind::Print:
      os << "(" << op.value << ")";
      break;
    case OpKind::Undo:
    case OpKind::Invalid:
      break;
  }
  return os;
}
