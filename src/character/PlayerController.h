#pragma once

#include <cstdint>
#include <memory>

#include "character/PlayerConfig.h"
#include "character/PlayerState.h"
#include "ecs/Components.h"
#include "fsm/TimedEffects.h"
#include "world/TileMap.h"

class EntityAnimations;

// Per-player state machine data. Lives on the player entity.
struct PlayerRuntime {
  PlayerState state = PlayerState::Spawn;
  std::uint32_t stateSerial = 0;  // bumps on every entry, so re-entering restarts the animation
  float stateTime = 0.0F;
  int facingX = 1;
  int health = 2;
  int maxHealth = 2;
  int jumpsUsed = 0;
  bool onGround = false;
  bool deathFinished = false;
  bool respawnRequested = false;
  int wallDirX = 0;
  std::uint32_t attackSerial = 0;  // one per swing; a target is hit at most once per swing
  TimedEffects<PlayerState> effects;

  [[nodiscard]] bool dead() const { return state == PlayerState::Death; }
  [[nodiscard]] bool invulnerable() const { return effects.active(EffectKind::Invulnerable); }
  [[nodiscard]] bool attacking() const {
    return state == PlayerState::Attack1 || state == PlayerState::Attack2;
  }
};

class PlayerController {
 public:
  explicit PlayerController(PlayerConfig cfg,
                            std::shared_ptr<const EntityAnimations> anims = nullptr);

  [[nodiscard]] const PlayerConfig& config() const { return cfg_; }
  [[nodiscard]] const std::shared_ptr<const EntityAnimations>& animations() const {
    return anims_;
  }

  // Full reset at the given feet position; the player starts in the spawn state.
  void spawn(PlayerRuntime& rt, Transform& t, Velocity& v, float x, float y) const;

  void tick(PlayerRuntime& rt,
            Transform& t,
            Velocity& v,
            const AABB& box,
            const InputState& in,
            const TileMap& map,
            float dt) const;

  // False when the hit was ignored (invulnerable, spawning or dead).
  bool takeDamage(PlayerRuntime& rt, Velocity& v, int amount) const;
  // False when nothing changed (dead or already at full health).
  bool heal(PlayerRuntime& rt, int amount) const;

  [[nodiscard]] float stateDuration(PlayerState s) const;
  // True while the current attack is on one of its active frames.
  [[nodiscard]] bool attackActive(const PlayerRuntime& rt, int animFrame) const;
  [[nodiscard]] Rect attackBox(const PlayerRuntime& rt, const Transform& t) const;

  // Applies the transition when the table allows it; otherwise reports it and keeps the state.
  bool enter(PlayerRuntime& rt, PlayerState next, bool restart = false) const;

 private:
  void onEffectExpired(PlayerRuntime& rt,
                       Velocity& v,
                       const InputState& in,
                       const TimedEffects<PlayerState>::Effect& e) const;
  void handleActions(PlayerRuntime& rt, Velocity& v, const InputState& in) const;
  void startAttack(PlayerRuntime& rt, PlayerState which) const;
  void endAttack(PlayerRuntime& rt) const;
  void startJump(PlayerRuntime& rt, Velocity& v) const;
  void steer(PlayerRuntime& rt, Velocity& v, const InputState& in) const;
  void resolveAirborne(PlayerRuntime& rt,
                       Transform& t,
                       Velocity& v,
                       const AABB& box,
                       const InputState& in,
                       const TileMap& map) const;
  void die(PlayerRuntime& rt, Velocity& v) const;
  [[nodiscard]] PlayerState locomotion(const PlayerRuntime& rt,
                                       const Velocity& v,
                                       const InputState& in) const;

  PlayerConfig cfg_;
  std::shared_ptr<const EntityAnimations> anims_;
};
