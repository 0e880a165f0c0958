#include "world/Physics.h"

#include <algorithm>
#include <array>

#include "ecs/Components.h"

namespace {

constexpr float kEps = 0.001F;
constexpr float kLandTolerance = 0.05F;  // feet may sit this far below a platform top
constexpr float kGroundProbe = 1.0F;

bool blocksLanding(TileCollision c, float rowTop, float oldBottom) {
  if (c == TileCollision::Solid)
    return true;
  return c == TileCollision::Platform && rowTop >= oldBottom - kLandTolerance;
}

bool solidColumn(const TileMap& map, int col, int r0, int r1) {
  for (int r = r0; r <= r1; ++r) {
    if (map.collisionAtCell(col, r) == TileCollision::Solid)
      return true;
  }
  return false;
}

bool solidRow(const TileMap& map, int row, int c0, int c1) {
  for (int c = c0; c <= c1; ++c) {
    if (map.collisionAtCell(c, row) == TileCollision::Solid)
      return true;
  }
  return false;
}

}  // namespace

namespace Physics {

Rect bodyRect(const Transform& t, const AABB& box) {
  return Rect{t.pos.x - box.w * 0.5F, t.pos.y - box.h, box.w, box.h};
}

void applyGravity(Velocity& v, float gravity, float maxFallSpeed, float dt) {
  v.v.y += gravity * dt;
  if (maxFallSpeed > 0.0F) {
    v.v.y = std::min(v.v.y, maxFallSpeed);
  }
}

// NOLINTNEXTLINE
StepResult moveAndCollide(const TileMap& map,
                          Transform& t,
                          Velocity& v,
                          const AABB& box,
                          float dt,
                          bool wasOnGround) {
  StepResult res{};
  const float ts = map.tileSize();
  const float halfW = box.w * 0.5F;

  // X axis
  const float dx = v.v.x * dt;
  if (dx != 0.0F) {
    const int r0 = map.cellY(t.pos.y - box.h + kEps);
    const int r1 = map.cellY(t.pos.y - kEps);
    bool blocked = false;
    if (dx > 0.0F) {
      const float edge = t.pos.x + halfW;
      const int c0 = map.cellX(edge);
      const int c1 = map.cellX(edge + dx);
      for (int c = c0; c <= c1 && !blocked; ++c) {
        if (solidColumn(map, c, r0, r1)) {
          t.pos.x = static_cast<float>(c) * ts - halfW;
          res.wallHitX = 1;
          blocked = true;
        }
      }
    } else {
      const float edge = t.pos.x - halfW;
      const int c0 = map.cellX(edge - kEps);
      const int c1 = map.cellX(edge + dx);
      for (int c = c0; c >= c1 && !blocked; --c) {
        if (solidColumn(map, c, r0, r1)) {
          t.pos.x = static_cast<float>(c + 1) * ts + halfW;
          res.wallHitX = -1;
          blocked = true;
        }
      }
    }
    if (blocked) {
      v.v.x = 0.0F;
    } else {
      t.pos.x += dx;
    }
  }

  // Y axis
  const float dy = v.v.y * dt;
  const int c0 = map.cellX(t.pos.x - halfW + kEps);
  const int c1 = map.cellX(t.pos.x + halfW - kEps);
  if (dy > 0.0F) {
    const float bottom = t.pos.y;
    const int r0 = map.cellY(bottom);
    const int r1 = map.cellY(bottom + dy);
    for (int r = r0; r <= r1 && !res.onGround; ++r) {
      const float rowTop = static_cast<float>(r) * ts;
      for (int c = c0; c <= c1; ++c) {
        const TileCollision cls = map.collisionAtCell(c, r);
        if (blocksLanding(cls, rowTop, bottom)) {
          t.pos.y = rowTop;
          v.v.y = 0.0F;
          res.onGround = true;
          res.ground = cls;
          break;
        }
      }
    }
    if (!res.onGround) {
      t.pos.y += dy;
    }
  } else if (dy < 0.0F) {
    const float top = t.pos.y - box.h;
    const int r0 = map.cellY(top - kEps);
    const int r1 = map.cellY(top + dy);
    bool blocked = false;
    for (int r = r0; r >= r1 && !blocked; --r) {
      if (solidRow(map, r, c0, c1)) {
        t.pos.y = static_cast<float>(r + 1) * ts + box.h;
        v.v.y = 0.0F;
        res.hitCeiling = true;
        blocked = true;
      }
    }
    if (!blocked) {
      t.pos.y += dy;
    }
  } else {
    res.onGround = groundBelow(map, t, box);
    if (res.onGround) {
      res.ground = map.collisionAt(t.pos.x, t.pos.y + kGroundProbe);
    }
  }

  res.landed = res.onGround && !wasOnGround;
  return res;
}

bool groundBelow(const TileMap& map, const Transform& t, const AABB& box) {
  const float halfW = box.w * 0.5F;
  const float probeY = t.pos.y + kGroundProbe;
  const int row = map.cellY(probeY);
  const float rowTop = static_cast<float>(row) * map.tileSize();
  if (t.pos.y < rowTop - kGroundProbe || t.pos.y > rowTop + kLandTolerance) {
    return false;
  }
  const int c0 = map.cellX(t.pos.x - halfW + kEps);
  const int c1 = map.cellX(t.pos.x + halfW - kEps);
  for (int c = c0; c <= c1; ++c) {
    const TileCollision cls = map.collisionAtCell(c, row);
    if (cls == TileCollision::Solid || cls == TileCollision::Platform)
      return true;
  }
  return false;
}

int wallContacts(const TileMap& map, const Transform& t, const AABB& box, int dirX, float probe) {
  if (dirX == 0 || probe <= 0.0F)
    return 0;
  const float d = (dirX < 0) ? -1.0F : 1.0F;
  const float x = t.pos.x + d * (box.w * 0.5F + probe);
  const float top = t.pos.y - box.h;
  const std::array<float, 3> samples{top + 1.0F, t.pos.y - box.h * 0.5F, t.pos.y - 1.0F};
  int hits = 0;
  for (float y : samples) {
    if (map.isSolidAt(x, y))
      ++hits;
  }
  return hits;
}

bool touchingWall(const TileMap& map, const Transform& t, const AABB& box, int dirX, float probe) {
  return wallContacts(map, t, box, dirX, probe) > 0;
}

std::optional<float> ledgeAt(const TileMap& map,
                             const Transform& t,
                             const AABB& box,
                             int dirX,
                             float reach) {
  if (dirX == 0)
    return std::nullopt;
  const float d = (dirX < 0) ? -1.0F : 1.0F;
  const int col = map.cellX(t.pos.x + d * (box.w * 0.5F + 1.0F));
  const float top = t.pos.y - box.h;
  const float ts = map.tileSize();
  const int r0 = map.cellY(top - reach);
  const int r1 = map.cellY(top + reach);
  for (int r = r0; r <= r1; ++r) {
    const float rowTop = static_cast<float>(r) * ts;
    if (rowTop < top - reach || rowTop > top + reach)
      continue;
    if (map.collisionAtCell(col, r) != TileCollision::Solid)
      continue;
    if (map.collisionAtCell(col, r - 1) == TileCollision::Solid)
      continue;
    return rowTop;
  }
  return std::nullopt;
}

bool groundAhead(const TileMap& map, const Transform& t, const AABB& box, int dirX) {
  const float d = (dirX < 0) ? -1.0F : 1.0F;
  const float x = t.pos.x + d * (box.w * 0.5F + 2.0F);
  const TileCollision cls = map.collisionAt(x, t.pos.y + 2.0F);
  return cls == TileCollision::Solid || cls == TileCollision::Platform;
}

}  // namespace Physics
