#include "enemy/EnemyController.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "anim/EntityAnimations.h"
#include "util/Log.h"
#include "world/Physics.h"

namespace {

constexpr float kDefaultSpawnDuration = 0.3F;
constexpr float kDefaultAttackDuration = 0.6F;
constexpr float kDefaultHitDuration = 0.3F;
constexpr float kDefaultDeathDuration = 0.6F;

bool freeToAct(EnemyState s) {
  return s == EnemyState::Idle || s == EnemyState::Run || s == EnemyState::Jump ||
         s == EnemyState::Fall;
}

}  // namespace

EnemyController::EnemyController(EnemyConfig cfg, std::shared_ptr<const EntityAnimations> anims)
    : cfg_(std::move(cfg)), anims_(std::move(anims)) {}

void EnemyController::spawn(EnemyRuntime& rt,
                            Transform& t,
                            Velocity& v,
                            float x,
                            float y,
                            int facingX) const {
  const std::uint32_t serial = rt.stateSerial;
  rt = EnemyRuntime{};
  rt.stateSerial = serial + 1;
  rt.state = EnemyState::Spawn;
  rt.health = cfg_.combat.health;
  rt.facingX = (facingX < 0) ? -1 : 1;
  rt.effects.start(EffectKind::StateTimer, stateDuration(EnemyState::Spawn));
  t.pos = Vec2{x, y};
  v.v = Vec2{};
}

float EnemyController::stateDuration(EnemyState s) const {
  float configured = 0.0F;
  float fallback = 0.0F;
  switch (s) {
    case EnemyState::Spawn:
      configured = cfg_.combat.spawnDuration;
      fallback = kDefaultSpawnDuration;
      break;
    case EnemyState::Attack1:
      configured = cfg_.attack.attack1Duration;
      fallback = kDefaultAttackDuration;
      break;
    case EnemyState::Attack2:
      configured = cfg_.attack.attack2Duration;
      fallback = kDefaultAttackDuration;
      break;
    case EnemyState::Hit:
      configured = cfg_.combat.hitDuration;
      fallback = kDefaultHitDuration;
      break;
    case EnemyState::Death:
      configured = cfg_.combat.deathDuration;
      fallback = kDefaultDeathDuration;
      break;
    default:
      return 0.0F;
  }
  if (configured > 0.0F)
    return configured;
  if (anims_ && !anims_->isPlaceholder()) {
    const float total = anims_->totalDuration(toString(s));
    if (total > 0.0F)
      return total;
  }
  return fallback;
}

bool EnemyController::enter(EnemyRuntime& rt, EnemyState next) const {
  if (next == rt.state)
    return true;
  if (!kEnemyTransitions.allowed(rt.state, next)) {
    Log::errorf(nullptr, "{}: transition {} -> {} is not allowed", cfg_.id, toString(rt.state),
                toString(next));
    return false;
  }
  rt.state = next;
  rt.stateTime = 0.0F;
  ++rt.stateSerial;
  return true;
}

EnemyState EnemyController::locomotion(const EnemyRuntime& rt, const Velocity& v) const {
  if (rt.onGround)
    return (v.v.x != 0.0F) ? EnemyState::Run : EnemyState::Idle;
  return (v.v.y < 0.0F) ? EnemyState::Jump : EnemyState::Fall;
}

bool EnemyController::inAttackRange(const Transform& t, std::optional<Vec2> target) const {
  if (!target)
    return false;
  return std::fabs(target->x - t.pos.x) <= cfg_.ai.attackRange &&
         std::fabs(target->y - t.pos.y) <= cfg_.ai.aggroHeight;
}

void EnemyController::tick(EnemyRuntime& rt,
                           Transform& t,
                           Velocity& v,
                           const AABB& box,
                           std::optional<Vec2> target,
                           const TileMap& map,
                           float dt) const {
  rt.stateTime += dt;
  for (const auto& e : rt.effects.tick(dt)) {
    if (e.kind == EffectKind::StateTimer)
      onStateTimer(rt, t, v, target);
  }

  if (freeToAct(rt.state)) {
    think(rt, t, v, box, target, map);
  } else {
    v.v.x = 0.0F;
  }

  Physics::applyGravity(v, cfg_.move.gravity, cfg_.move.maxFallSpeed, dt);
  const Physics::StepResult res = Physics::moveAndCollide(map, t, v, box, dt, rt.onGround);
  rt.onGround = res.onGround;

  const Rect world = map.worldBounds();
  const float halfW = box.w * 0.5F;
  if (world.w > box.w)
    t.pos.x = std::clamp(t.pos.x, world.x + halfW, world.x + world.w - halfW);

  if (freeToAct(rt.state))
    (void)enter(rt, locomotion(rt, v));
}

void EnemyController::onStateTimer(EnemyRuntime& rt,
                                   const Transform& t,
                                   const Velocity& v,
                                   std::optional<Vec2> target) const {
  switch (rt.state) {
    case EnemyState::Spawn:
    case EnemyState::Hit:
      (void)enter(rt, locomotion(rt, v));
      break;
    case EnemyState::Attack1:
      if (cfg_.ai.chainAttack2 && inAttackRange(t, target)) {
        startAttack(rt, EnemyState::Attack2);
        break;
      }
      rt.effects.start(EffectKind::AttackCooldown, cfg_.attack.cooldown);
      (void)enter(rt, locomotion(rt, v));
      break;
    case EnemyState::Attack2:
      rt.effects.start(EffectKind::AttackCooldown, cfg_.attack.cooldown);
      (void)enter(rt, locomotion(rt, v));
      break;
    case EnemyState::Death:
      rt.removable = true;
      break;
    default:
      break;
  }
}

void EnemyController::think(EnemyRuntime& rt,
                            const Transform& t,
                            Velocity& v,
                            const AABB& box,
                            std::optional<Vec2> target,
                            const TileMap& map) const {
  rt.aggro = false;
  if (target) {
    const float dx = target->x - t.pos.x;
    const float dy = target->y - t.pos.y;
    rt.aggro = std::fabs(dx) <= cfg_.ai.aggroRange && std::fabs(dy) <= cfg_.ai.aggroHeight;
    if (rt.aggro && dx != 0.0F)
      rt.facingX = (dx > 0.0F) ? 1 : -1;
  }

  if (rt.aggro) {
    if (rt.onGround && inAttackRange(t, target) && !rt.effects.active(EffectKind::AttackCooldown)) {
      v.v.x = 0.0F;
      startAttack(rt, EnemyState::Attack1);
      return;
    }
    // Chase, but never off a ledge or into a wall.
    const bool blocked = Physics::touchingWall(map, t, box, rt.facingX) ||
                         (rt.onGround && !Physics::groundAhead(map, t, box, rt.facingX));
    const bool close = inAttackRange(t, target);
    v.v.x = (blocked || close)
                ? 0.0F
                : static_cast<float>(rt.facingX) * cfg_.move.speed * cfg_.ai.chaseSpeedScale;
    return;
  }

  if (rt.effects.active(EffectKind::ActionPause)) {
    v.v.x = 0.0F;
    return;
  }

  const bool wall = cfg_.move.turnOnWall && Physics::touchingWall(map, t, box, rt.facingX);
  const bool edge =
      cfg_.move.turnOnEdge && rt.onGround && !Physics::groundAhead(map, t, box, rt.facingX);
  if (wall || edge) {
    rt.facingX = -rt.facingX;
    v.v.x = 0.0F;
    rt.effects.start(EffectKind::ActionPause, cfg_.move.turnPause);
    return;
  }
  v.v.x = static_cast<float>(rt.facingX) * cfg_.move.speed;
}

void EnemyController::startAttack(EnemyRuntime& rt, EnemyState which) const {
  if (!enter(rt, which))
    return;
  ++rt.attackSerial;
  rt.effects.start(EffectKind::StateTimer, stateDuration(which));
}

bool EnemyController::takeDamage(EnemyRuntime& rt, Velocity& v, int amount) const {
  if (amount <= 0 || rt.dead() || rt.state == EnemyState::Spawn ||
      rt.effects.active(EffectKind::Invulnerable))
    return false;

  rt.health = std::max(0, rt.health - amount);
  v.v.x = 0.0F;
  if (rt.health == 0) {
    rt.effects.clear();
    if (enter(rt, EnemyState::Death))
      rt.effects.start(EffectKind::StateTimer, stateDuration(EnemyState::Death));
    return true;
  }
  rt.effects.start(EffectKind::Invulnerable, cfg_.combat.iframes);
  if (enter(rt, EnemyState::Hit))
    rt.effects.start(EffectKind::StateTimer, stateDuration(EnemyState::Hit));
  return true;
}

bool EnemyController::attackActive(const EnemyRuntime& rt, int animFrame) const {
  if (!rt.attacking())
    return false;
  const EnemyConfig::FrameRange& range =
      (rt.state == EnemyState::Attack1) ? cfg_.attack.active1 : cfg_.attack.active2;
  const int frames = std::max(1, anims_ ? anims_->frameCount(toString(rt.state)) : 0);
  const int from = std::min(range.from, frames - 1);
  const int to = std::min(range.to, frames - 1);
  return animFrame >= from && animFrame <= to;
}

Rect EnemyController::attackBox(const EnemyRuntime& rt, const Transform& t) const {
  const EnemyConfig::Attack& a = cfg_.attack;
  const float x = (rt.facingX > 0) ? t.pos.x + a.offsetX : t.pos.x - a.offsetX - a.hitboxW;
  return Rect{x, t.pos.y + a.offsetY - a.hitboxH, a.hitboxW, a.hitboxH};
}
