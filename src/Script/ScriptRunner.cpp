#include "ScriptRunner.h"

#include <optional>
#include <vector>

#include "Ops/Parser.h"
#include "Text/Text.h"
#include "Utils/Debug.h"

using namespace std;

RunStatus runScript(string_view input, ostream& out) {
  optional<ParsedScript> script = parseScript(input);
  if (!script) {
    return RunStatus::MalformedHeader;
  }

  // The declared count is checked against valid operations only.
  vector<Operation> ops = filterInvalid(script->ops);
  debug("runScript:", script->ops.size() - ops.size(), "invalid lines dropped");

  Text text("", script->declaredCount);
  text.apply(ops, out);
  out << text.output() << '\n';
  return RunStatus::Ok;
}
