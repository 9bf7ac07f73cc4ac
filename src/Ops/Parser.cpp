#include "Parser.h"

#include <algorithm>
#include <iterator>

#include "Utils/Debug.h"
#include "Utils/Lines.h"
#include "Utils/StringUtils.h"
#include "Utils/Utf8.h"

using namespace std;

// Drop the single separator between the command code and its argument (one
// UTF-8 code point), but keep any further leading whitespace of the argument.
static string_view removeSeparator(string_view rest) {
  return rest.substr(codePointWidth(rest));
}

// Shared by Delete (2) and Print (3).
static Operation parseNumericOperand(char code, string_view arg) {
  optional<size_t> n = parseUnsigned(trim(arg));
  if (!n) return Operation::invalid();
  return code == '2' ? Operation::del(*n) : Operation::print(*n);
}

Operation parseOperation(string_view line) {
  string_view s = trimStart(line);
  if (s.empty()) return Operation::invalid();

  char code = s.front();
  string_view rest = s.substr(1);

  switch (code) {
    case '1':
      return Operation::append(removeSeparator(rest));
    case '2':
    case '3':
      return parseNumericOperand(code, removeSeparator(rest));
    case '4':
      return Operation::undo();
    default:
      return Operation::invalid();
  }
}

optional<ParsedScript> parseScript(string_view input) {
  vector<string_view> lines = splitLines(input);
  if (lines.empty()) {
    debug("parseScript: empty input");
    return nullopt;
  }

  optional<size_t> count = parseUnsigned(lines.front());
  if (!count) {
    debug("parseScript: malformed header", makePrintable(lines.front()));
    return nullopt;
  }

  ParsedScript script;
  script.declaredCount = *count;
  script.ops.reserve(lines.size() - 1);
  for (size_t i = 1; i < lines.size(); i++) {
    script.ops.push_back(parseOperation(lines[i]));
  }

  debug("parseScript: declared", script.declaredCount, "parsed", script.ops.size());
  return script;
}

vector<Operation> filterInvalid(const vector<Operation>& ops) {
  vector<Operation> valid;
  valid.reserve(ops.size());
  copy_if(ops.begin(), ops.end(), back_inserter(valid),
          [](const Operation& op) { return op.isValid(); });
  return valid;
}
