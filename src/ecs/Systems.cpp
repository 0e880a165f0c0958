#include "ecs/Systems.h"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "anim/EntityAnimations.h"
#include "anim/Playback.h"
#include "character/PlayerController.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"
#include "ecs/World.h"
#include "enemy/EnemyController.h"
#include "util/Log.h"
#include "world/Physics.h"
#include "world/TileMap.h"

namespace Systems {

namespace {

bool playerAlive(World& w) {
  return entityAlive(w.registry, w.player) &&
         w.registry.all_of<PlayerRuntime, Transform, Velocity, AABB>(w.player);
}

// Frame the animation system will show for the owner's current state entry.
int shownFrame(const AnimPlayback& anim, std::uint32_t serial) {
  return (anim.serial == serial && anim.started) ? anim.cursor.frame : 0;
}

LoopMode playerLoopMode(PlayerState s) {
  switch (s) {
    case PlayerState::Idle:
    case PlayerState::Walk:
    case PlayerState::Fall:
    case PlayerState::WallHold:
    case PlayerState::WallSlide:
    case PlayerState::LedgeGrab:
      return LoopMode::Loop;
    default:
      return LoopMode::Once;
  }
}

LoopMode enemyLoopMode(EnemyState s) {
  switch (s) {
    case EnemyState::Idle:
    case EnemyState::Run:
    case EnemyState::Fall:
      return LoopMode::Loop;
    default:
      return LoopMode::Once;
  }
}

void select(AnimPlayback& anim, const char* state, std::uint32_t serial, LoopMode mode, int facingX) {
  anim.facingX = facingX;
  if (anim.serial == serial && anim.state == state)
    return;
  anim.state = state;
  anim.serial = serial;
  anim.mode = mode;
  anim.cursor = PlaybackCursor{};
  anim.started = false;
}

}  // namespace

void player(World& w, const InputState& in, float dt) {
  if (!playerAlive(w))
    return;
  const PlayerController* ctl = w.playerController();
  auto& rt = w.registry.get<PlayerRuntime>(w.player);
  auto& t = w.registry.get<Transform>(w.player);
  auto& v = w.registry.get<Velocity>(w.player);
  const auto& box = w.registry.get<AABB>(w.player);

  ctl->tick(rt, t, v, box, in, w.map(), dt);
  if (rt.respawnRequested) {
    w.respawnPlayer();
  }
}

void enemies(World& w, float dt) {
  std::optional<Vec2> target;
  if (playerAlive(w)) {
    const auto& prt = w.registry.get<PlayerRuntime>(w.player);
    if (!prt.dead() && prt.state != PlayerState::Spawn)
      target = w.registry.get<Transform>(w.player).pos;
  }

  std::vector<EntityId> removed;
  auto view = w.registry.view<EnemyTag, Transform, Velocity, AABB, EnemyRuntime, EnemyBrain>();
  for (auto entity : view) {
    auto& t = view.get<Transform>(entity);
    auto& v = view.get<Velocity>(entity);
    const auto& box = view.get<AABB>(entity);
    auto& rt = view.get<EnemyRuntime>(entity);
    const auto& brain = view.get<EnemyBrain>(entity);

    brain.ctl->tick(rt, t, v, box, target, w.map(), dt);
    if (rt.removable)
      removed.push_back(entity);
  }

  for (EntityId id : removed) {
    w.destroy(id);
    ++w.enemyKills;
  }
}

void combat(World& w) {
  if (!playerAlive(w))
    return;
  const PlayerController* ctl = w.playerController();
  auto& prt = w.registry.get<PlayerRuntime>(w.player);
  const auto& pT = w.registry.get<Transform>(w.player);
  auto& pV = w.registry.get<Velocity>(w.player);
  const auto& pB = w.registry.get<AABB>(w.player);
  const Rect playerBody = Physics::bodyRect(pT, pB);

  const int playerFrame = w.registry.all_of<AnimPlayback>(w.player)
                              ? shownFrame(w.registry.get<AnimPlayback>(w.player), prt.stateSerial)
                              : 0;
  const bool swinging = ctl->attackActive(prt, playerFrame);
  const Rect swing = ctl->attackBox(prt, pT);

  auto view =
      w.registry.view<EnemyTag, Transform, Velocity, AABB, EnemyRuntime, EnemyBrain, AnimPlayback>();
  for (auto entity : view) {
    const auto& eT = view.get<Transform>(entity);
    auto& eV = view.get<Velocity>(entity);
    const auto& eB = view.get<AABB>(entity);
    auto& ert = view.get<EnemyRuntime>(entity);
    const auto& brain = view.get<EnemyBrain>(entity);
    const auto& eAnim = view.get<AnimPlayback>(entity);
    if (ert.dead())
      continue;

    // One hit per swing.
    if (swinging && ert.lastHitSerial != prt.attackSerial &&
        rectsOverlap(swing, Physics::bodyRect(eT, eB))) {
      ert.lastHitSerial = prt.attackSerial;
      (void)brain.ctl->takeDamage(ert, eV, ctl->config().attack.damage);
    }

    if (brain.ctl->attackActive(ert, shownFrame(eAnim, ert.stateSerial)) &&
        rectsOverlap(brain.ctl->attackBox(ert, eT), playerBody)) {
      if (ctl->takeDamage(prt, pV, brain.ctl->config().attack.damage))
        ++w.hurtEvents;
    }
  }
}

void hazards(World& w) {
  if (!playerAlive(w))
    return;
  const auto& rt = w.registry.get<PlayerRuntime>(w.player);
  const auto& t = w.registry.get<Transform>(w.player);
  if (rt.dead() || rt.state == PlayerState::Spawn)
    return;

  const TileMap& map = w.map();
  const Rect bounds = map.worldBounds();
  const float x = t.pos.x;
  const float y = t.pos.y;

  const bool outOfWorld = x < bounds.x - kOutOfWorldMargin ||
                          x > bounds.x + bounds.w + kOutOfWorldMargin ||
                          y < bounds.y - kOutOfWorldMargin ||
                          y > bounds.y + bounds.h + kOutOfWorldMargin;
  const bool onDamage =
      map.isDamageAt(x, y - 1.0F) || (rt.onGround && map.isDamageAt(x, y + 1.0F));

  bool inDeathZone = false;
  const int col = map.cellX(x);
  const int row = map.cellY(y - 1.0F);
  for (const MapObject* obj : map.objectsByName("death")) {
    inDeathZone = inDeathZone || (obj->x == col && obj->y == row);
  }

  if (outOfWorld || onDamage || inDeathZone) {
    w.respawnPlayer();
  }
}

void collectibles(World& w, float dt) {
  const bool canCollect = playerAlive(w) && !w.registry.get<PlayerRuntime>(w.player).dead();
  std::vector<EntityId> collected;

  auto view = w.registry.view<CollectibleTag, Transform, AABB, CollectibleState>();
  for (auto entity : view) {
    auto& t = view.get<Transform>(entity);
    const auto& box = view.get<AABB>(entity);
    auto& state = view.get<CollectibleState>(entity);

    state.bobTime += dt * state.bobSpeed;
    t.pos = Vec2{state.anchor.x, state.anchor.y + std::sin(state.bobTime) * state.amplitude};

    if (!canCollect)
      continue;
    const Rect playerBody = Physics::bodyRect(w.registry.get<Transform>(w.player),
                                              w.registry.get<AABB>(w.player));
    if (rectsOverlap(playerBody, Physics::bodyRect(t, box)))
      collected.push_back(entity);
  }

  for (EntityId id : collected) {
    const int restore = w.registry.get<CollectibleState>(id).healthRestore;
    (void)w.playerController()->heal(w.registry.get<PlayerRuntime>(w.player), restore);
    w.destroy(id);
    ++w.pickups;
  }
}

void animate(World& w, float dt) {
  {
    auto view = w.registry.view<PlayerRuntime, AnimPlayback>();
    for (auto entity : view) {
      const auto& rt = view.get<PlayerRuntime>(entity);
      select(view.get<AnimPlayback>(entity), toString(rt.state), rt.stateSerial,
             playerLoopMode(rt.state), rt.facingX);
    }
  }
  {
    auto view = w.registry.view<EnemyRuntime, AnimPlayback>();
    for (auto entity : view) {
      const auto& rt = view.get<EnemyRuntime>(entity);
      select(view.get<AnimPlayback>(entity), toString(rt.state), rt.stateSerial,
             enemyLoopMode(rt.state), rt.facingX);
    }
  }

  auto view = w.registry.view<AnimPlayback, Animated>();
  for (auto entity : view) {
    auto& anim = view.get<AnimPlayback>(entity);
    const auto& animated = view.get<Animated>(entity);
    if (!animated.anims || anim.state.empty())
      continue;

    const AnimationPtr animation = animated.anims->animation(anim.state);
    if (!animation || !animation->valid()) {
      if (w.noteMissingAnimation(animated.anims->entityType(), anim.state)) {
        Log::warnf(nullptr, "{}: no animation for state '{}'; drawing a placeholder",
                   animated.anims->entityType(), anim.state);
      }
      continue;
    }

    if (!anim.started) {
      Playback::start(anim.cursor, *animation);
      anim.started = true;
    }
    Playback::update(anim.cursor, *animation, anim.mode, dt);
  }
}

}  // namespace Systems
