#pragma once

#include <cstddef>

// Global ceilings enforced by Text::apply. Guard against pathological scripts
// independent of buffer size.
struct EngineLimits {
  static constexpr size_t DEFAULT_MAX_OPS = 1000000;
  static constexpr size_t DEFAULT_MAX_DELETED_CHARS = DEFAULT_MAX_OPS * 2;

  // Most operations a single apply() accepts.
  size_t maxOps = DEFAULT_MAX_OPS;
  // Most characters applied Deletes may remove in total during one apply().
  size_t maxDeletedChars = DEFAULT_MAX_DELETED_CHARS;

  EngineLimits() = default;

  EngineLimits(size_t maxOps, size_t maxDeletedChars)
      : maxOps(maxOps), maxDeletedChars(maxDeletedChars) {}
};
