#pragma once

#include <iostream>
#include <string_view>

enum class RunStatus {
  Ok,
  // First line was not a count. Nothing was applied or written.
  MalformedHeader,
};

// Parse `input`, drop Invalid lines, run the rest against an empty buffer and
// write print output followed by the final buffer and a newline to `out`.
// Fatal engine errors (see Text::apply) propagate as std::runtime_error.
RunStatus runScript(std::string_view input, std::ostream& out = std::cout);
