#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "ecs/Components.h"
#include "enemy/EnemyConfig.h"
#include "enemy/EnemyState.h"
#include "fsm/TimedEffects.h"
#include "world/TileMap.h"

class EntityAnimations;

struct EnemyRuntime {
  EnemyState state = EnemyState::Spawn;
  std::uint32_t stateSerial = 0;
  float stateTime = 0.0F;
  int facingX = -1;
  int health = 1;
  bool onGround = false;
  bool aggro = false;
  bool removable = false;          // death animation finished
  std::uint32_t attackSerial = 0;
  std::uint32_t lastHitSerial = 0;  // player swing that last hurt this enemy
  TimedEffects<EnemyState> effects;

  [[nodiscard]] bool dead() const { return state == EnemyState::Death; }
  [[nodiscard]] bool attacking() const {
    return state == EnemyState::Attack1 || state == EnemyState::Attack2;
  }
};

class EnemyController {
 public:
  explicit EnemyController(EnemyConfig cfg,
                           std::shared_ptr<const EntityAnimations> anims = nullptr);

  [[nodiscard]] const EnemyConfig& config() const { return cfg_; }
  [[nodiscard]] const std::shared_ptr<const EntityAnimations>& animations() const {
    return anims_;
  }

  void spawn(EnemyRuntime& rt, Transform& t, Velocity& v, float x, float y, int facingX) const;

  // `target` is the player's feet position, or nothing when the player cannot be chased.
  void tick(EnemyRuntime& rt,
            Transform& t,
            Velocity& v,
            const AABB& box,
            std::optional<Vec2> target,
            const TileMap& map,
            float dt) const;

  bool takeDamage(EnemyRuntime& rt, Velocity& v, int amount) const;

  [[nodiscard]] float stateDuration(EnemyState s) const;
  [[nodiscard]] bool attackActive(const EnemyRuntime& rt, int animFrame) const;
  [[nodiscard]] Rect attackBox(const EnemyRuntime& rt, const Transform& t) const;

  bool enter(EnemyRuntime& rt, EnemyState next) const;

 private:
  void onStateTimer(EnemyRuntime& rt,
                    const Transform& t,
                    const Velocity& v,
                    std::optional<Vec2> target) const;
  void think(EnemyRuntime& rt,
             const Transform& t,
             Velocity& v,
             const AABB& box,
             std::optional<Vec2> target,
             const TileMap& map) const;
  void startAttack(EnemyRuntime& rt, EnemyState which) const;
  [[nodiscard]] bool inAttackRange(const Transform& t, std::optional<Vec2> target) const;
  [[nodiscard]] EnemyState locomotion(const EnemyRuntime& rt, const Velocity& v) const;

  EnemyConfig cfg_;
  std::shared_ptr<const EntityAnimations> anims_;
};

// Shared per-type controller attached to each enemy entity.
struct EnemyBrain {
  std::shared_ptr<const EnemyController> ctl;
};
