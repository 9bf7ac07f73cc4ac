// src/ffi_exports.cpp

#include <sstream>
#include <exception>
#include <string>

#include "ffi_exports.h"
#include "Script/ScriptRunner.h"
#include "Text/EngineLimits.h"
#include "Utils/Debug.h"

extern "C" {
// EngineLimits keeps these as constexpr members, which have no C symbol.
extern const unsigned long SIMPLEEDITOR_MAX_OPS = EngineLimits::DEFAULT_MAX_OPS;
extern const unsigned long SIMPLEEDITOR_MAX_DELETED_CHARS = EngineLimits::DEFAULT_MAX_DELETED_CHARS;

const char *simpleeditor_run(const char *script) {
  static std::string result_storage;

  if (script == nullptr) {
    result_storage = "error: null script";
    return result_storage.c_str();
  }

  std::ostringstream oss;
  try {
    RunStatus status = runScript(script, oss);
    result_storage = status == RunStatus::Ok ? oss.str() : std::string();
  } catch (const std::exception &e) {
    // Nothing may unwind into the host. Prints that already ran stay in front
    // of the message, as they would on the CLI's stdout.
    result_storage = oss.str() + "error: " + e.what();
  }

  return result_storage.c_str();
}

const char *simpleeditor_get_debug() {
  static std::string debug_storage;
  debug_storage = take_debug_output();
  return debug_storage.c_str();
}

}
