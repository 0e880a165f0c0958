#pragma once

#include <cstddef>
#include <cstdint>

#include "fsm/TransitionTable.h"

enum class EnemyState : std::uint8_t {
  Spawn,
  Idle,
  Run,
  Jump,
  Fall,
  Attack1,
  Attack2,
  Hit,
  Death,
  Count,
};

inline constexpr std::size_t kEnemyStateCount = static_cast<std::size_t>(EnemyState::Count);

constexpr const char* toString(EnemyState s) {
  switch (s) {
    case EnemyState::Spawn:
      return "spawn";
    case EnemyState::Idle:
      return "idle";
    case EnemyState::Run:
      return "run";
    case EnemyState::Jump:
      return "jump";
    case EnemyState::Fall:
      return "fall";
    case EnemyState::Attack1:
      return "attack1";
    case EnemyState::Attack2:
      return "attack2";
    case EnemyState::Hit:
      return "hit";
    case EnemyState::Death:
      return "death";
    case EnemyState::Count:
      break;
  }
  return "?";
}

using EnemyTransitions = TransitionTable<EnemyState, kEnemyStateCount>;

inline constexpr EnemyTransitions kEnemyTransitions = [] {
  using S = EnemyState;
  EnemyTransitions t;
  t.allow(S::Spawn, {S::Idle, S::Run, S::Jump, S::Fall});
  t.allow(S::Idle, {S::Run, S::Jump, S::Fall, S::Attack1});
  t.allow(S::Run, {S::Idle, S::Jump, S::Fall, S::Attack1});
  t.allow(S::Jump, {S::Fall, S::Idle, S::Run});
  t.allow(S::Fall, {S::Jump, S::Idle, S::Run});
  t.allow(S::Attack1, {S::Attack2, S::Idle, S::Run, S::Jump, S::Fall});
  t.allow(S::Attack2, {S::Idle, S::Run, S::Jump, S::Fall});
  t.allow(S::Hit, {S::Idle, S::Run, S::Jump, S::Fall});
  t.allowFromAllExcept(S::Hit, {S::Death, S::Spawn});
  t.allowFromAllExcept(S::Death, {});
  return t;
}();

// Death is terminal: the entity is removed once its animation has played.
static_assert([] {
  for (std::size_t i = 0; i < kEnemyStateCount; ++i) {
    const auto s = static_cast<EnemyState>(i);
    if (s != EnemyState::Death && !kEnemyTransitions.hasExit(s))
      return false;
  }
  return !kEnemyTransitions.hasExit(EnemyState::Death);
}());
static_assert(!kEnemyTransitions.allowed(EnemyState::Idle, EnemyState::Attack2));
