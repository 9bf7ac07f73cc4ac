#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "Operation.h"

struct ParsedScript {
  size_t declaredCount = 0;
  std::vector<Operation> ops;

  ParsedScript() = default;
  ParsedScript(size_t count, std::vector<Operation> ops) : declaredCount(count), ops(std::move(ops)) {}

  bool operator==(const ParsedScript& other) const {
    return declaredCount == other.declaredCount && ops == other.ops;
  }
};

// Parse one script line. Total: anything unrecognized becomes Invalid.
// Append payloads view into `line`.
Operation parseOperation(std::string_view line);

// Parse a whole script. The first line is the declared operation count and
// must be a plain non-negative integer, otherwise nullopt. Every later line is
// kept, in order, Invalid ones included. Ops view into `input`, which must
// outlive the result.
std::optional<ParsedScript> parseScript(std::string_view input);

// Copy of `ops` without the Invalid entries, order preserved.
std::vector<Operation> filterInvalid(const std::vector<Operation>& ops);
