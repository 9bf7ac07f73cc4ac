// Debug.h

#pragma once
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>

#ifdef SIMPLEEDITOR_DEBUG
constexpr bool DEBUG_ENABLED = true;
#else
constexpr bool DEBUG_ENABLED = false;
#endif

// A script may skip up to a million operations, each of which logs a line.
constexpr size_t DEBUG_MAX_LINES = 10000;
constexpr const char* DEBUG_TRUNCATED_MARKER = "[debug log truncated]";

// In-memory sink shared by the whole process. Never written to stdout, which
// carries script output; callers decide where to dump it.
struct DebugSink {
  std::ostringstream stream;
  size_t lines = 0;
  bool truncated = false;

  void reset() {
    stream.str("");
    stream.clear();
    lines = 0;
    truncated = false;
  }
};

inline DebugSink& debugSink() {
  static DebugSink sink;
  return sink;
}

// Space between elements, and new line. Past DEBUG_MAX_LINES the rest is
// dropped and a single marker line is written.
template<typename... Args>
inline void debug([[maybe_unused]] Args&&... args){
  if constexpr(DEBUG_ENABLED){
    auto& sink = debugSink();
    if (sink.lines >= DEBUG_MAX_LINES) {
      if (!sink.truncated) {
        sink.stream << DEBUG_TRUNCATED_MARKER << '\n';
        sink.truncated = true;
      }
      return;
    }
    auto& os = sink.stream;
    const char* sep = "";
    ((os<<sep<<std::forward<Args>(args), sep=" "), ...);
    os<<'\n';
    sink.lines++;
  }
}

inline std::string get_debug_output() {
  return debugSink().stream.str();
}

inline void clear_debug_output() {
  debugSink().reset();
}

// Read and clear in one step.
inline std::string take_debug_output() {
  std::string out = get_debug_output();
  clear_debug_output();
  return out;
}
