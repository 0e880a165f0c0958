#define BOOST_TEST_MODULE StateMachineTests
#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <vector>

#include "character/PlayerState.h"
#include "enemy/EnemyState.h"
#include "fsm/TimedEffects.h"
#include "fsm/TransitionTable.h"

namespace {

enum class Door : std::uint8_t { Closed, Open, Locked, Broken, Count };

using DoorTable = TransitionTable<Door, 4>;

}  // namespace

BOOST_AUTO_TEST_SUITE(Transitions)

BOOST_AUTO_TEST_CASE(AllowAddsOnlyTheListedEdges) {
  DoorTable t;
  t.allow(Door::Closed, {Door::Open, Door::Locked});
  BOOST_CHECK(t.allowed(Door::Closed, Door::Open));
  BOOST_CHECK(t.allowed(Door::Closed, Door::Locked));
  BOOST_CHECK(!t.allowed(Door::Open, Door::Closed));
  BOOST_CHECK(t.hasExit(Door::Closed));
  BOOST_CHECK(!t.hasExit(Door::Open));
  BOOST_CHECK(t.reachable(Door::Open));
  BOOST_CHECK(!t.reachable(Door::Broken));
  BOOST_CHECK(!t.everyStateHasExit());
}

BOOST_AUTO_TEST_CASE(AllowFromAllExceptSkipsSelfAndExclusions) {
  DoorTable t;
  t.allowFromAllExcept(Door::Broken, {Door::Locked});
  BOOST_CHECK(t.allowed(Door::Closed, Door::Broken));
  BOOST_CHECK(t.allowed(Door::Open, Door::Broken));
  BOOST_CHECK(!t.allowed(Door::Locked, Door::Broken));
  BOOST_CHECK(!t.allowed(Door::Broken, Door::Broken));
}

BOOST_AUTO_TEST_CASE(SelfLoopIsNotAnExit) {
  DoorTable t;
  t.allow(Door::Open, {Door::Open});
  BOOST_CHECK(t.allowed(Door::Open, Door::Open));
  BOOST_CHECK(!t.hasExit(Door::Open));
  BOOST_CHECK(!t.reachable(Door::Open));
}

BOOST_AUTO_TEST_CASE(PlayerTableRules) {
  using S = PlayerState;
  const PlayerTransitions& t = kPlayerTransitions;
  BOOST_CHECK(t.everyStateHasExit());
  BOOST_CHECK(t.allowed(S::Idle, S::Hit));
  BOOST_CHECK(t.allowed(S::Attack2, S::Hit));
  BOOST_CHECK(!t.allowed(S::Spawn, S::Hit));
  BOOST_CHECK(!t.allowed(S::Roll, S::Hit));
  BOOST_CHECK(!t.allowed(S::Death, S::Hit));
  BOOST_CHECK(t.allowed(S::Hit, S::Death));
  BOOST_CHECK(t.allowed(S::Spawn, S::Death));
  BOOST_CHECK(!t.allowed(S::Walk, S::Attack2));
  BOOST_CHECK(t.allowed(S::Jump, S::Trans));
  BOOST_CHECK(t.allowed(S::WallHold, S::WallSlide));
  BOOST_CHECK(!t.allowed(S::Idle, S::WallHold));

  for (std::size_t i = 0; i < kPlayerStateCount; ++i) {
    const auto s = static_cast<PlayerState>(i);
    BOOST_CHECK(t.allowed(s, S::Death) == (s != S::Death));
  }
}

BOOST_AUTO_TEST_CASE(EnemyDeathIsTerminal) {
  using S = EnemyState;
  const EnemyTransitions& t = kEnemyTransitions;
  BOOST_CHECK(!t.hasExit(S::Death));
  BOOST_CHECK(!t.allowed(S::Death, S::Spawn));
  BOOST_CHECK(t.allowed(S::Run, S::Death));
  BOOST_CHECK(t.allowed(S::Attack1, S::Hit));
  BOOST_CHECK(!t.allowed(S::Spawn, S::Hit));
  BOOST_CHECK_EQUAL(toString(S::Attack2), "attack2");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Countdowns)

BOOST_AUTO_TEST_CASE(EffectExpiresWithItsHandover) {
  TimedEffects<PlayerState> fx;
  fx.start(EffectKind::StateTimer, 0.5F, PlayerState::Idle);
  BOOST_CHECK(fx.active(EffectKind::StateTimer));

  BOOST_CHECK(fx.tick(0.25F).empty());
  BOOST_CHECK_CLOSE(fx.remaining(EffectKind::StateTimer), 0.25F, 0.001);

  const auto expired = fx.tick(0.25F);
  BOOST_REQUIRE_EQUAL(expired.size(), 1U);
  BOOST_CHECK(expired[0].kind == EffectKind::StateTimer);
  BOOST_REQUIRE(expired[0].onExpire.has_value());
  BOOST_CHECK(*expired[0].onExpire == PlayerState::Idle);
  BOOST_CHECK(!fx.active(EffectKind::StateTimer));
  BOOST_CHECK_EQUAL(fx.remaining(EffectKind::StateTimer), 0.0F);
}

BOOST_AUTO_TEST_CASE(SimultaneousExpiriesComeBackInKindOrder) {
  TimedEffects<EnemyState> fx;
  fx.start(EffectKind::ActionPause, 0.1F);
  fx.start(EffectKind::Invulnerable, 0.1F);
  fx.start(EffectKind::StateTimer, 0.1F, EnemyState::Run);
  fx.start(EffectKind::DashCooldown, 5.0F);

  const auto expired = fx.tick(0.2F);
  BOOST_REQUIRE_EQUAL(expired.size(), 3U);
  BOOST_CHECK(expired[0].kind == EffectKind::StateTimer);
  BOOST_CHECK(expired[1].kind == EffectKind::Invulnerable);
  BOOST_CHECK(expired[2].kind == EffectKind::ActionPause);
  BOOST_CHECK(!expired[2].onExpire.has_value());
  BOOST_CHECK(fx.active(EffectKind::DashCooldown));
}

BOOST_AUTO_TEST_CASE(RestartReplacesTheRunningCountdown) {
  TimedEffects<PlayerState> fx;
  fx.start(EffectKind::ComboWindow, 0.1F);
  (void)fx.tick(0.05F);
  fx.start(EffectKind::ComboWindow, 0.3F);
  BOOST_CHECK(fx.tick(0.1F).empty());
  BOOST_CHECK_CLOSE(fx.remaining(EffectKind::ComboWindow), 0.2F, 0.001);
}

BOOST_AUTO_TEST_CASE(CancelAndClearDropEffectsSilently) {
  TimedEffects<PlayerState> fx;
  fx.start(EffectKind::AttackCooldown, 0.1F);
  fx.start(EffectKind::WallGrace, 0.1F);
  fx.cancel(EffectKind::AttackCooldown);
  BOOST_CHECK(!fx.active(EffectKind::AttackCooldown));
  BOOST_CHECK(fx.active(EffectKind::WallGrace));

  fx.clear();
  BOOST_CHECK(!fx.active(EffectKind::WallGrace));
  BOOST_CHECK(fx.tick(1.0F).empty());
}

BOOST_AUTO_TEST_CASE(ZeroLengthEffectExpiresOnTheNextTick) {
  TimedEffects<PlayerState> fx;
  fx.start(EffectKind::Invulnerable, -1.0F);
  BOOST_CHECK(fx.active(EffectKind::Invulnerable));
  BOOST_CHECK_EQUAL(fx.tick(0.0F).size(), 1U);
}

BOOST_AUTO_TEST_SUITE_END()
