#pragma once

#include <cstdint>

// Longest physics step; longer updates are split.
inline constexpr float kMaxSubstep = 1.0F / 120.0F;
// Longest update accepted at all (after a stall).
inline constexpr float kMaxFrameDt = 0.25F;

struct TimeStep {
  float dt = 0.0F;  // seconds
  uint64_t frame = 0;
};
