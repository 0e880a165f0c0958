#include "character/PlayerController.h"

#include <algorithm>
#include <utility>

#include "anim/EntityAnimations.h"
#include "util/Log.h"
#include "world/Physics.h"

namespace {

constexpr float kDefaultRollDuration = 0.5F;
constexpr float kDefaultHitDuration = 0.4F;
constexpr float kDefaultDeathDuration = 1.0F;
constexpr float kDefaultTransDuration = 0.1F;

bool groundLocomotion(PlayerState s) {
  return s == PlayerState::Idle || s == PlayerState::Walk;
}

bool airLocomotion(PlayerState s) {
  return s == PlayerState::Jump || s == PlayerState::Trans || s == PlayerState::Fall;
}

bool freeToAct(PlayerState s) {
  return groundLocomotion(s) || airLocomotion(s);
}

}  // namespace

PlayerController::PlayerController(PlayerConfig cfg, std::shared_ptr<const EntityAnimations> anims)
    : cfg_(std::move(cfg)), anims_(std::move(anims)) {}

void PlayerController::spawn(PlayerRuntime& rt, Transform& t, Velocity& v, float x, float y) const {
  const std::uint32_t serial = rt.stateSerial;
  rt = PlayerRuntime{};
  rt.stateSerial = serial + 1;
  rt.maxHealth = cfg_.maxHealth;
  rt.health = cfg_.maxHealth;
  rt.state = PlayerState::Spawn;

  const float d = stateDuration(PlayerState::Spawn);
  rt.effects.start(EffectKind::StateTimer, d);
  rt.effects.start(EffectKind::Invulnerable, d);

  t.pos = Vec2{x, y};
  v.v = Vec2{};
}

float PlayerController::stateDuration(PlayerState s) const {
  float configured = 0.0F;
  float fallback = 0.0F;
  switch (s) {
    case PlayerState::Spawn:
      configured = cfg_.spawn.duration;
      fallback = PlayerConfig::Spawn{}.duration;
      break;
    case PlayerState::Attack1:
      configured = cfg_.attack.attack1Duration;
      fallback = PlayerConfig::Attack{}.attack1Duration;
      break;
    case PlayerState::Attack2:
      configured = cfg_.attack.attack2Duration;
      fallback = PlayerConfig::Attack{}.attack2Duration;
      break;
    case PlayerState::Dash:
      configured = cfg_.dash.duration;
      fallback = PlayerConfig::Dash{}.duration;
      break;
    case PlayerState::Roll:
      configured = cfg_.roll.duration;
      fallback = kDefaultRollDuration;
      break;
    case PlayerState::Hit:
      configured = cfg_.combat.hitDuration;
      fallback = kDefaultHitDuration;
      break;
    case PlayerState::Death:
      configured = cfg_.combat.deathDuration;
      fallback = kDefaultDeathDuration;
      break;
    case PlayerState::Trans:
      fallback = kDefaultTransDuration;
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

bool PlayerController::enter(PlayerRuntime& rt, PlayerState next, bool restart) const {
  if (next == rt.state && !restart)
    return true;
  if (!kPlayerTransitions.allowed(rt.state, next)) {
    Log::errorf(nullptr, "player: transition {} -> {} is not allowed", toString(rt.state),
                toString(next));
    return false;
  }
  rt.state = next;
  rt.stateTime = 0.0F;
  ++rt.stateSerial;
  return true;
}

PlayerState PlayerController::locomotion(const PlayerRuntime& rt,
                                         const Velocity& v,
                                         const InputState& in) const {
  if (rt.onGround)
    return (in.moveX() != 0) ? PlayerState::Walk : PlayerState::Idle;
  return (v.v.y < 0.0F) ? PlayerState::Jump : PlayerState::Fall;
}

void PlayerController::tick(PlayerRuntime& rt,
                            Transform& t,
                            Velocity& v,
                            const AABB& box,
                            const InputState& in,
                            const TileMap& map,
                            float dt) const {
  rt.stateTime += dt;
  for (const auto& e : rt.effects.tick(dt)) {
    onEffectExpired(rt, v, in, e);
  }

  if (rt.dead()) {
    v.v = Vec2{};
    if (rt.deathFinished && in.jumpPressed)
      rt.respawnRequested = true;
    return;
  }

  const bool controllable = rt.state != PlayerState::Spawn && rt.state != PlayerState::Hit;
  if (controllable) {
    handleActions(rt, v, in);
    steer(rt, v, in);
  } else if (rt.state == PlayerState::Spawn) {
    v.v.x = 0.0F;
  }

  if (rt.state == PlayerState::LedgeGrab || rt.state == PlayerState::WallHold) {
    v.v = Vec2{};
  } else {
    Physics::applyGravity(v, cfg_.move.gravity, cfg_.move.maxFallSpeed, dt);
    if (rt.state == PlayerState::WallSlide)
      v.v.y = std::min(v.v.y, cfg_.wall.slideSpeed);
  }

  if (rt.state != PlayerState::LedgeGrab) {
    const bool wasOnGround = rt.onGround;
    const Physics::StepResult res = Physics::moveAndCollide(map, t, v, box, dt, wasOnGround);
    rt.onGround = res.onGround;
    if (rt.onGround) {
      rt.jumpsUsed = 0;
    } else if (wasOnGround && rt.jumpsUsed == 0) {
      // Walking off an edge spends the ground jump.
      rt.jumpsUsed = 1;
    }

    const Rect world = map.worldBounds();
    const float halfW = box.w * 0.5F;
    if (world.w > box.w)
      t.pos.x = std::clamp(t.pos.x, world.x + halfW, world.x + world.w - halfW);
  }

  if (rt.onGround) {
    if (groundLocomotion(rt.state) || airLocomotion(rt.state) ||
        rt.state == PlayerState::WallHold || rt.state == PlayerState::WallSlide) {
      if (rt.state == PlayerState::Trans)
        rt.effects.cancel(EffectKind::StateTimer);
      rt.effects.cancel(EffectKind::WallGrace);
      (void)enter(rt, locomotion(rt, v, in));
    }
  } else if (controllable) {
    resolveAirborne(rt, t, v, box, in, map);
  }
}

void PlayerController::onEffectExpired(PlayerRuntime& rt,
                                       Velocity& v,
                                       const InputState& in,
                                       const TimedEffects<PlayerState>::Effect& e) const {
  if (e.kind == EffectKind::WallGrace) {
    if (rt.state == PlayerState::WallHold && e.onExpire)
      (void)enter(rt, *e.onExpire);
    return;
  }
  if (e.kind != EffectKind::StateTimer)
    return;

  switch (rt.state) {
    case PlayerState::Spawn:
    case PlayerState::Roll:
    case PlayerState::Hit:
      (void)enter(rt, locomotion(rt, v, in));
      break;
    case PlayerState::Attack1:
    case PlayerState::Attack2:
      endAttack(rt);
      (void)enter(rt, locomotion(rt, v, in));
      break;
    case PlayerState::Dash:
      rt.effects.start(EffectKind::DashCooldown, cfg_.dash.cooldown);
      (void)enter(rt, locomotion(rt, v, in));
      break;
    case PlayerState::Trans:
      (void)enter(rt, rt.onGround ? locomotion(rt, v, in) : e.onExpire.value_or(PlayerState::Fall));
      break;
    case PlayerState::Death:
      rt.deathFinished = true;
      break;
    default:
      break;
  }
}

void PlayerController::handleActions(PlayerRuntime& rt, Velocity& v, const InputState& in) const {
  const PlayerState s = rt.state;

  if (in.attackPressed) {
    if (s == PlayerState::Attack1 && rt.effects.active(EffectKind::ComboWindow)) {
      startAttack(rt, PlayerState::Attack2);
      return;
    }
    if (freeToAct(s) && !rt.effects.active(EffectKind::AttackCooldown)) {
      startAttack(rt, PlayerState::Attack1);
      return;
    }
  }

  if (in.dashPressed && freeToAct(s) && !rt.effects.active(EffectKind::DashCooldown)) {
    if (enter(rt, PlayerState::Dash))
      rt.effects.start(EffectKind::StateTimer, stateDuration(PlayerState::Dash));
    return;
  }

  if (in.rollPressed && rt.onGround && groundLocomotion(s)) {
    if (enter(rt, PlayerState::Roll)) {
      const float d = stateDuration(PlayerState::Roll);
      rt.effects.start(EffectKind::StateTimer, d);
      if (rt.effects.remaining(EffectKind::Invulnerable) < d)
        rt.effects.start(EffectKind::Invulnerable, d);
    }
    return;
  }

  if (!in.jumpPressed)
    return;

  if (s == PlayerState::LedgeGrab) {
    v.v.y = -cfg_.move.jumpSpeed;
    rt.jumpsUsed = 1;
    (void)enter(rt, PlayerState::Jump, true);
    return;
  }
  if (s == PlayerState::WallHold || s == PlayerState::WallSlide) {
    rt.effects.cancel(EffectKind::WallGrace);
    rt.facingX = -rt.wallDirX;
    v.v.x = static_cast<float>(rt.facingX) * cfg_.wall.jumpSpeedX;
    v.v.y = -cfg_.move.jumpSpeed;
    rt.jumpsUsed = 1;
    rt.effects.start(EffectKind::ActionPause, cfg_.wall.jumpLockout);
    (void)enter(rt, PlayerState::Jump, true);
    return;
  }
  if (freeToAct(s) && rt.jumpsUsed < cfg_.move.maxJumps)
    startJump(rt, v);
}

void PlayerController::startAttack(PlayerRuntime& rt, PlayerState which) const {
  if (!enter(rt, which))
    return;
  ++rt.attackSerial;
  rt.effects.start(EffectKind::StateTimer, stateDuration(which));
  if (which == PlayerState::Attack1) {
    rt.effects.start(EffectKind::ComboWindow, cfg_.attack.comboWindow);
  } else {
    rt.effects.cancel(EffectKind::ComboWindow);
  }
}

void PlayerController::endAttack(PlayerRuntime& rt) const {
  rt.effects.cancel(EffectKind::ComboWindow);
  rt.effects.start(EffectKind::AttackCooldown, cfg_.attack.cooldown);
}

void PlayerController::startJump(PlayerRuntime& rt, Velocity& v) const {
  if (rt.state == PlayerState::Trans)
    rt.effects.cancel(EffectKind::StateTimer);
  if (!enter(rt, PlayerState::Jump, true))
    return;
  v.v.y = -cfg_.move.jumpSpeed;
  ++rt.jumpsUsed;
  rt.onGround = false;
}

void PlayerController::steer(PlayerRuntime& rt, Velocity& v, const InputState& in) const {
  const int moveX = in.moveX();
  const float facing = static_cast<float>(rt.facingX);
  switch (rt.state) {
    case PlayerState::Dash:
      v.v.x = facing * cfg_.dash.speed;
      break;
    case PlayerState::Roll:
      v.v.x = facing * cfg_.roll.speed;
      break;
    case PlayerState::Attack1:
      v.v.x = static_cast<float>(moveX) * cfg_.move.speed * cfg_.attack.attack1MoveScale;
      break;
    case PlayerState::Attack2:
      v.v.x = static_cast<float>(moveX) * cfg_.move.speed * cfg_.attack.attack2MoveScale;
      break;
    case PlayerState::LedgeGrab:
    case PlayerState::WallHold:
      v.v.x = 0.0F;
      break;
    default:
      if (rt.effects.active(EffectKind::ActionPause))
        break;
      v.v.x = static_cast<float>(moveX) * cfg_.move.speed;
      if (moveX != 0)
        rt.facingX = moveX;
      break;
  }
}

void PlayerController::resolveAirborne(PlayerRuntime& rt,
                                       Transform& t,
                                       Velocity& v,
                                       const AABB& box,
                                       const InputState& in,
                                       const TileMap& map) const {
  const int moveX = in.moveX();

  switch (rt.state) {
    case PlayerState::Idle:
    case PlayerState::Walk:
      (void)enter(rt, (v.v.y < 0.0F) ? PlayerState::Jump : PlayerState::Fall);
      break;
    case PlayerState::Jump:
      if (v.v.y < 0.0F)
        break;
      if (anims_ && anims_->hasOwnAnimation(toString(PlayerState::Trans))) {
        if (enter(rt, PlayerState::Trans))
          rt.effects.start(EffectKind::StateTimer, stateDuration(PlayerState::Trans),
                           PlayerState::Fall);
      } else {
        (void)enter(rt, PlayerState::Fall);
      }
      break;
    case PlayerState::LedgeGrab:
      if (in.downPressed || (moveX != 0 && moveX != rt.wallDirX))
        (void)enter(rt, PlayerState::Fall);
      return;
    case PlayerState::WallHold:
    case PlayerState::WallSlide:
      if (moveX != rt.wallDirX || !Physics::touchingWall(map, t, box, rt.wallDirX)) {
        rt.effects.cancel(EffectKind::WallGrace);
        (void)enter(rt, PlayerState::Fall);
      }
      return;
    default:
      break;
  }

  if (!cfg_.wall.enabled || moveX == 0 || v.v.y < 0.0F || !airLocomotion(rt.state))
    return;

  // A ledge within reach wins over a plain wall.
  if (auto top = Physics::ledgeAt(map, t, box, moveX, cfg_.wall.ledgeReach)) {
    if (enter(rt, PlayerState::LedgeGrab)) {
      rt.effects.cancel(EffectKind::StateTimer);
      t.pos.y = *top + box.h;
      v.v = Vec2{};
      rt.wallDirX = moveX;
      rt.facingX = moveX;
    }
    return;
  }

  if (Physics::wallContacts(map, t, box, moveX) >= 2) {
    if (enter(rt, PlayerState::WallHold)) {
      rt.effects.cancel(EffectKind::StateTimer);
      rt.effects.start(EffectKind::WallGrace, cfg_.wall.holdGrace, PlayerState::WallSlide);
      v.v = Vec2{};
      rt.wallDirX = moveX;
      rt.facingX = moveX;
    }
  }
}

bool PlayerController::takeDamage(PlayerRuntime& rt, Velocity& v, int amount) const {
  if (amount <= 0 || rt.dead() || rt.state == PlayerState::Spawn || rt.invulnerable())
    return false;

  rt.health = std::max(0, rt.health - amount);
  if (rt.health == 0) {
    die(rt, v);
    return true;
  }

  rt.effects.cancel(EffectKind::ComboWindow);
  rt.effects.cancel(EffectKind::WallGrace);
  rt.effects.start(EffectKind::Invulnerable, cfg_.combat.invulnerability);
  if (enter(rt, PlayerState::Hit))
    rt.effects.start(EffectKind::StateTimer, stateDuration(PlayerState::Hit));
  v.v.x *= cfg_.combat.hitSpeedScale;
  return true;
}

bool PlayerController::heal(PlayerRuntime& rt, int amount) const {
  if (amount <= 0 || rt.dead() || rt.health >= rt.maxHealth)
    return false;
  rt.health = std::min(rt.maxHealth, rt.health + amount);
  return true;
}

void PlayerController::die(PlayerRuntime& rt, Velocity& v) const {
  rt.effects.clear();
  rt.health = 0;
  rt.deathFinished = false;
  rt.respawnRequested = false;
  v.v = Vec2{};
  if (enter(rt, PlayerState::Death))
    rt.effects.start(EffectKind::StateTimer, stateDuration(PlayerState::Death));
}

bool PlayerController::attackActive(const PlayerRuntime& rt, int animFrame) const {
  if (!rt.attacking())
    return false;
  const PlayerConfig::FrameRange& range =
      (rt.state == PlayerState::Attack1) ? cfg_.attack.active1 : cfg_.attack.active2;
  int frames = anims_ ? anims_->frameCount(toString(rt.state)) : 0;
  frames = std::max(1, frames);
  const int from = std::min(range.from, frames - 1);
  const int to = std::min(range.to, frames - 1);
  return animFrame >= from && animFrame <= to;
}

Rect PlayerController::attackBox(const PlayerRuntime& rt, const Transform& t) const {
  const PlayerConfig::Attack& a = cfg_.attack;
  const float x = (rt.facingX > 0) ? t.pos.x + a.offsetX : t.pos.x - a.offsetX - a.hitboxW;
  return Rect{x, t.pos.y + a.offsetY - a.hitboxH, a.hitboxW, a.hitboxH};
}
