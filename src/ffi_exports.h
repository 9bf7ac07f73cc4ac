#pragma once

// C ABI for embedding hosts (e.g. LuaJIT ffi.cdef). Plain C declarations only.

#ifdef __cplusplus
extern "C" {
#endif

extern const unsigned long SIMPLEEDITOR_MAX_OPS;
extern const unsigned long SIMPLEEDITOR_MAX_DELETED_CHARS;

// Returns exactly what the CLI writes to stdout for `script`. A malformed
// header gives "". On a fatal error the result is the print output written
// before the failure followed by "error: <message>". Valid until the next
// call.
const char *simpleeditor_run(const char *script);

// Returns the debug log collected so far and clears it. Empty unless built
// with SIMPLEEDITOR_DEBUG.
const char *simpleeditor_get_debug(void);

#ifdef __cplusplus
}
#endif
