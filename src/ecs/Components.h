#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "anim/Playback.h"
#include "ecs/Entity.h"

class EntityAnimations;

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
};

// Feet pivot: x is the body centre, y the body bottom (world pixels).
struct Transform {
  Vec2 pos{};
};

// px/s
struct Velocity {
  Vec2 v{};
};

// Collision body around the feet pivot.
struct AABB {
  float w = 24.0F;
  float h = 32.0F;
};

struct InputState {
  bool left = false;
  bool right = false;
  bool upHeld = false;
  bool downHeld = false;
  bool downPressed = false;
  bool jumpPressed = false;
  bool jumpHeld = false;
  bool jumpReleased = false;
  bool attackPressed = false;
  bool attackHeld = false;
  bool dashPressed = false;
  bool dashHeld = false;
  bool rollPressed = false;
  bool rollHeld = false;

  [[nodiscard]] int moveX() const { return (right ? 1 : 0) - (left ? 1 : 0); }
};

struct PlayerTag {};

struct EnemyTag {};

struct CollectibleTag {};

struct CollectibleState {
  int healthRestore = 1;
  Vec2 anchor{};  // floating rest position (feet)
  float bobTime = 0.0F;
  float amplitude = 16.0F;
  float bobSpeed = 2.0F;  // radians per second
};

struct DebugName {
  std::string name;
};

// Which animation an entity shows and where it is inside it.
struct AnimPlayback {
  std::string state;  // logical state name, "" until first update
  std::uint32_t serial = 0;  // owner's state entry count; a change restarts the animation
  PlaybackCursor cursor{};
  LoopMode mode = LoopMode::Loop;
  int facingX = 1;
  bool started = false;
};

// Shared read-only animation table for the entity's type.
struct Animated {
  std::shared_ptr<const EntityAnimations> anims;
};
