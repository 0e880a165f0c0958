#pragma once

#include <cstdint>

#include "anim/Animation.h"

enum class LoopMode : std::uint8_t {
  Loop,
  Once,  // stops on the final frame and reports finished
};

// Per-entity position inside a shared Animation.
struct PlaybackCursor {
  int frame = 0;
  float timer = 0.0F;  // seconds spent on the current frame
  int step = 1;        // +1 / -1, ping-pong only
  bool finished = false;
};

namespace Playback {

void start(PlaybackCursor& c, const Animation& anim);

// Moves to the next frame. Bounds are checked before the index changes.
void advance(PlaybackCursor& c, const Animation& anim, LoopMode mode);

// Accumulates dt and advances once per elapsed frame duration, carrying the remainder.
void update(PlaybackCursor& c, const Animation& anim, LoopMode mode, float dt);

// Pulls a cursor back into range after the animation it points at changed.
void clampTo(PlaybackCursor& c, const Animation& anim);

}  // namespace Playback
