#pragma once

#include <optional>

#include "world/TileMap.h"

struct AABB;
struct Transform;
struct Velocity;

namespace Physics {

struct StepResult {
  bool onGround = false;
  bool landed = false;      // touched ground this step after being airborne
  bool hitCeiling = false;
  int wallHitX = 0;         // -1 / +1 when horizontal motion was stopped
  TileCollision ground = TileCollision::None;
};

[[nodiscard]] Rect bodyRect(const Transform& t, const AABB& box);

void applyGravity(Velocity& v, float gravity, float maxFallSpeed, float dt);

// Integrate x and resolve against the grid, then integrate y and resolve. Every tile
// column/row between the old and new edge is visited. Only solid tiles block sideways and
// upward; platforms block landing when the feet start at or above their top.
StepResult moveAndCollide(const TileMap& map,
                          Transform& t,
                          Velocity& v,
                          const AABB& box,
                          float dt,
                          bool wasOnGround);

// Solid tile just beneath the feet (solid or platform).
[[nodiscard]] bool groundBelow(const TileMap& map, const Transform& t, const AABB& box);

// Number of head/middle/feet sample points that hit a solid tile `probe` px beside the body.
[[nodiscard]] int wallContacts(const TileMap& map,
                               const Transform& t,
                               const AABB& box,
                               int dirX,
                               float probe = 1.0F);
[[nodiscard]] bool touchingWall(const TileMap& map,
                                const Transform& t,
                                const AABB& box,
                                int dirX,
                                float probe = 1.0F);

// Top y of a grabbable ledge (solid tile with free space above) beside the body whose top
// lies within `reach` of the body top.
[[nodiscard]] std::optional<float> ledgeAt(const TileMap& map,
                                           const Transform& t,
                                           const AABB& box,
                                           int dirX,
                                           float reach);

// Ground under the leading foot, a couple of pixels ahead.
[[nodiscard]] bool groundAhead(const TileMap& map, const Transform& t, const AABB& box, int dirX);

}  // namespace Physics
