#pragma once

#include <cstddef>
#include <cstdint>

#include "fsm/TransitionTable.h"

enum class PlayerState : std::uint8_t {
  Spawn,
  Idle,
  Walk,
  Jump,
  Trans,  // jump -> fall apex
  Fall,
  Attack1,
  Attack2,
  Dash,
  Roll,
  Hit,
  Death,
  WallHold,
  WallSlide,
  LedgeGrab,
  Count,
};

inline constexpr std::size_t kPlayerStateCount = static_cast<std::size_t>(PlayerState::Count);

// Animation state name for each player state.
constexpr const char* toString(PlayerState s) {
  switch (s) {
    case PlayerState::Spawn:
      return "spawn";
    case PlayerState::Idle:
      return "idle";
    case PlayerState::Walk:
      return "walk";
    case PlayerState::Jump:
      return "jump";
    case PlayerState::Trans:
      return "trans";
    case PlayerState::Fall:
      return "fall";
    case PlayerState::Attack1:
      return "attack1";
    case PlayerState::Attack2:
      return "attack2";
    case PlayerState::Dash:
      return "dash";
    case PlayerState::Roll:
      return "roll";
    case PlayerState::Hit:
      return "hit";
    case PlayerState::Death:
      return "death";
    case PlayerState::WallHold:
      return "wall_hold";
    case PlayerState::WallSlide:
      return "wall_slide";
    case PlayerState::LedgeGrab:
      return "ledge_grab";
    case PlayerState::Count:
      break;
  }
  return "?";
}

using PlayerTransitions = TransitionTable<PlayerState, kPlayerStateCount>;

inline constexpr PlayerTransitions kPlayerTransitions = [] {
  using S = PlayerState;
  PlayerTransitions t;
  t.allow(S::Spawn, {S::Idle, S::Walk, S::Jump, S::Fall});
  t.allow(S::Idle, {S::Idle, S::Walk, S::Jump, S::Fall, S::Attack1, S::Dash, S::Roll});
  t.allow(S::Walk, {S::Idle, S::Walk, S::Jump, S::Fall, S::Attack1, S::Dash, S::Roll});
  t.allow(S::Jump, {S::Jump, S::Trans, S::Fall, S::Idle, S::Walk, S::Attack1, S::Dash,
                    S::WallHold, S::LedgeGrab});
  t.allow(S::Trans,
          {S::Jump, S::Fall, S::Idle, S::Walk, S::Attack1, S::Dash, S::WallHold, S::LedgeGrab});
  t.allow(S::Fall, {S::Jump, S::Idle, S::Walk, S::Attack1, S::Dash, S::WallHold, S::LedgeGrab});
  t.allow(S::Attack1, {S::Attack2, S::Idle, S::Walk, S::Jump, S::Fall});
  t.allow(S::Attack2, {S::Idle, S::Walk, S::Jump, S::Fall});
  t.allow(S::Dash, {S::Idle, S::Walk, S::Jump, S::Fall});
  t.allow(S::Roll, {S::Idle, S::Walk, S::Jump, S::Fall});
  t.allow(S::Hit, {S::Idle, S::Walk, S::Jump, S::Fall});
  t.allow(S::WallHold, {S::WallSlide, S::Fall, S::Jump, S::Idle, S::Walk, S::LedgeGrab});
  t.allow(S::WallSlide, {S::Fall, S::Jump, S::Idle, S::Walk, S::LedgeGrab});
  t.allow(S::LedgeGrab, {S::Jump, S::Fall, S::Idle});
  // Spawn and roll are invulnerable; damage never interrupts them.
  t.allowFromAllExcept(S::Hit, {S::Death, S::Spawn, S::Roll});
  t.allowFromAllExcept(S::Death, {});
  t.allow(S::Death, {S::Spawn});
  return t;
}();

static_assert(kPlayerTransitions.everyStateHasExit());
static_assert(kPlayerTransitions.allowed(PlayerState::Death, PlayerState::Spawn));
static_assert(!kPlayerTransitions.allowed(PlayerState::Death, PlayerState::Idle));
static_assert(kPlayerTransitions.allowed(PlayerState::Attack1, PlayerState::Attack2));
static_assert(!kPlayerTransitions.allowed(PlayerState::Idle, PlayerState::Attack2));
static_assert(kPlayerTransitions.reachable(PlayerState::Trans));
