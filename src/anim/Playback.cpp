#include "anim/Playback.h"

#include <algorithm>

namespace {

constexpr float kMinFrameSeconds = 0.001F;

bool startsAtEnd(PlayDirection d) {
  return d == PlayDirection::Reverse || d == PlayDirection::PingPongReverse;
}

}  // namespace

namespace Playback {

void start(PlaybackCursor& c, const Animation& anim) {
  const int n = anim.frameCount();
  c.timer = 0.0F;
  c.finished = false;
  c.frame = (startsAtEnd(anim.direction) && n > 0) ? n - 1 : 0;
  c.step = startsAtEnd(anim.direction) ? -1 : 1;
}

void advance(PlaybackCursor& c, const Animation& anim, LoopMode mode) {
  const int n = anim.frameCount();
  if (n <= 0 || c.finished) {
    return;
  }

  switch (anim.direction) {
    case PlayDirection::Forward:
      if (c.frame + 1 < n) {
        ++c.frame;
      } else if (mode == LoopMode::Loop) {
        c.frame = 0;
      } else {
        c.frame = n - 1;
        c.finished = true;
      }
      return;

    case PlayDirection::Reverse:
      if (c.frame - 1 >= 0) {
        --c.frame;
      } else if (mode == LoopMode::Loop) {
        c.frame = n - 1;
      } else {
        c.frame = 0;
        c.finished = true;
      }
      return;

    case PlayDirection::PingPong:
    case PlayDirection::PingPongReverse: {
      if (n == 1) {
        c.finished = (mode == LoopMode::Once);
        return;
      }
      int next = c.frame + c.step;
      if (next < 0 || next >= n) {
        // Turning at the end the cycle started from means one full cycle was played.
        const bool cycleDone = (anim.direction == PlayDirection::PingPong) ? (next < 0)
                                                                           : (next >= n);
        if (mode == LoopMode::Once && cycleDone) {
          c.finished = true;
          return;
        }
        c.step = -c.step;
        next = c.frame + c.step;
      }
      c.frame = next;
      return;
    }
  }
}

void update(PlaybackCursor& c, const Animation& anim, LoopMode mode, float dt) {
  if (!anim.valid()) {
    return;
  }
  clampTo(c, anim);
  c.timer += std::max(0.0F, dt);
  while (!c.finished) {
    const float d = std::max(kMinFrameSeconds, anim.durations[static_cast<std::size_t>(c.frame)]);
    if (c.timer < d) {
      break;
    }
    c.timer -= d;
    advance(c, anim, mode);
  }
  if (c.finished) {
    c.timer = 0.0F;
  }
}

void clampTo(PlaybackCursor& c, const Animation& anim) {
  const int n = anim.frameCount();
  if (n <= 0) {
    c.frame = 0;
    return;
  }
  c.frame = std::clamp(c.frame, 0, n - 1);
  if (c.step != 1 && c.step != -1) {
    c.step = 1;
  }
}

}  // namespace Playback
