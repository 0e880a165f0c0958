#define BOOST_TEST_MODULE PlayerControllerTests
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "TestSupport.h"
#include "character/PlayerController.h"
#include "util/Log.h"

namespace {

constexpr float kTick = 1.0F / 120.0F;

// 40 x 24 tiles of 16 px. A ledge floor (top y = 320) over columns 0-19, a lower floor
// (top y = 352) under everything, and a wall in column 36 from y = 192 down.
TileMap arena() {
  std::vector<std::string> rows(24, std::string(40, '.'));
  for (int c = 0; c < 20; ++c)
    rows[20][static_cast<std::size_t>(c)] = '#';
  for (int c = 0; c < 40; ++c) {
    rows[22][static_cast<std::size_t>(c)] = '#';
    rows[23][static_cast<std::size_t>(c)] = '#';
  }
  for (int r = 12; r <= 21; ++r)
    rows[static_cast<std::size_t>(r)][36] = '#';
  return TestSupport::makeMap(rows);
}

struct PlayerFixture {
  explicit PlayerFixture(PlayerConfig cfg = PlayerConfig{})
      : map(arena()), controller(std::move(cfg)) {
    box = AABB{controller.config().body.w, controller.config().body.h};
    Log::resetCounts();
  }

  // Runs `seconds` in fixed ticks; pressed edges only reach the first tick.
  void run(InputState in, float seconds) {
    const int ticks = std::max(1, static_cast<int>(seconds / kTick + 0.5F));
    for (int i = 0; i < ticks; ++i) {
      controller.tick(rt, t, v, box, in, map, kTick);
      in.jumpPressed = false;
      in.attackPressed = false;
      in.dashPressed = false;
      in.rollPressed = false;
      in.downPressed = false;
    }
  }

  void idle(float seconds) { run(InputState{}, seconds); }

  void spawnAndSettle(float x = 100.0F) {
    controller.spawn(rt, t, v, x, 320.0F);
    idle(0.7F);
  }

  TileMap map;
  PlayerController controller;
  PlayerRuntime rt;
  Transform t;
  Velocity v;
  AABB box;
};

InputState pressJump() {
  InputState in;
  in.jumpPressed = true;
  in.jumpHeld = true;
  return in;
}

InputState pressAttack() {
  InputState in;
  in.attackPressed = true;
  return in;
}

InputState holdRight() {
  InputState in;
  in.right = true;
  return in;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(PlayerMovement)

BOOST_AUTO_TEST_CASE(SpawnIsInvulnerableThenHandsOverToIdle) {
  PlayerFixture f;
  f.controller.spawn(f.rt, f.t, f.v, 100.0F, 320.0F);
  BOOST_CHECK(f.rt.state == PlayerState::Spawn);
  BOOST_CHECK(f.rt.invulnerable());
  BOOST_CHECK_EQUAL(f.rt.health, 2);

  BOOST_CHECK(!f.controller.takeDamage(f.rt, f.v, 1));
  BOOST_CHECK_EQUAL(f.rt.health, 2);

  // Input is ignored while spawning.
  f.run(holdRight(), 0.3F);
  BOOST_CHECK(f.rt.state == PlayerState::Spawn);
  BOOST_CHECK_EQUAL(f.t.pos.x, 100.0F);

  f.idle(0.4F);
  BOOST_CHECK(f.rt.state == PlayerState::Idle);
  BOOST_CHECK(!f.rt.invulnerable());
  BOOST_CHECK(f.rt.onGround);
  BOOST_CHECK_EQUAL(f.t.pos.y, 320.0F);
  BOOST_CHECK_EQUAL(Log::errorCount(), 0);
}

BOOST_AUTO_TEST_CASE(WalkFollowsInputAndFacing) {
  PlayerFixture f;
  f.spawnAndSettle();
  f.run(holdRight(), 0.1F);
  BOOST_CHECK(f.rt.state == PlayerState::Walk);
  BOOST_CHECK_EQUAL(f.rt.facingX, 1);
  BOOST_CHECK_EQUAL(f.v.v.x, 160.0F);
  BOOST_CHECK_GT(f.t.pos.x, 110.0F);

  InputState left;
  left.left = true;
  f.run(left, 0.05F);
  BOOST_CHECK_EQUAL(f.rt.facingX, -1);

  f.idle(0.05F);
  BOOST_CHECK(f.rt.state == PlayerState::Idle);
  BOOST_CHECK_EQUAL(f.v.v.x, 0.0F);
}

BOOST_AUTO_TEST_CASE(DoubleJumpThenNoMore) {
  PlayerFixture f;
  f.spawnAndSettle();

  f.run(pressJump(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Jump);
  BOOST_CHECK_EQUAL(f.rt.jumpsUsed, 1);
  BOOST_CHECK(!f.rt.onGround);
  BOOST_CHECK_LT(f.v.v.y, -650.0F);

  f.idle(0.2F);
  f.run(pressJump(), kTick);
  BOOST_CHECK_EQUAL(f.rt.jumpsUsed, 2);
  BOOST_CHECK_LT(f.v.v.y, -650.0F);

  f.idle(0.2F);
  const float before = f.v.v.y;
  f.run(pressJump(), kTick);
  BOOST_CHECK_EQUAL(f.rt.jumpsUsed, 2);
  BOOST_CHECK_GT(f.v.v.y, before);

  f.idle(2.0F);
  BOOST_CHECK(f.rt.onGround);
  BOOST_CHECK(f.rt.state == PlayerState::Idle);
  BOOST_CHECK_EQUAL(f.rt.jumpsUsed, 0);
  BOOST_CHECK_EQUAL(Log::errorCount(), 0);
}

BOOST_AUTO_TEST_CASE(JumpTurnsIntoFallAtTheApex) {
  PlayerFixture f;
  f.spawnAndSettle();
  f.run(pressJump(), kTick);
  f.idle(0.55F);
  BOOST_CHECK_GT(f.v.v.y, 0.0F);
  BOOST_CHECK(f.rt.state == PlayerState::Fall);
}

BOOST_AUTO_TEST_CASE(WalkingOffAnEdgeSpendsTheGroundJump) {
  PlayerFixture f;
  f.spawnAndSettle(300.0F);

  const InputState right = holdRight();
  for (int i = 0; i < 240 && f.rt.onGround; ++i)
    f.run(right, kTick);
  BOOST_REQUIRE(!f.rt.onGround);
  BOOST_CHECK(f.rt.state == PlayerState::Fall);
  BOOST_CHECK_EQUAL(f.rt.jumpsUsed, 1);

  f.run(pressJump(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Jump);
  BOOST_CHECK_EQUAL(f.rt.jumpsUsed, 2);
}

BOOST_AUTO_TEST_CASE(WallHoldSlidesAndWallJumpsAway) {
  PlayerFixture f;
  f.rt.state = PlayerState::Fall;
  f.t.pos = Vec2{563.5F, 250.0F};

  f.run(holdRight(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::WallHold);
  BOOST_CHECK_EQUAL(f.rt.wallDirX, 1);
  BOOST_CHECK_EQUAL(f.t.pos.x, 564.0F);

  const float heldY = f.t.pos.y;
  f.run(holdRight(), 0.2F);
  BOOST_CHECK(f.rt.state == PlayerState::WallHold);
  BOOST_CHECK_EQUAL(f.t.pos.y, heldY);

  f.run(holdRight(), 0.1F);
  BOOST_CHECK(f.rt.state == PlayerState::WallSlide);
  BOOST_CHECK_LE(f.v.v.y, f.controller.config().wall.slideSpeed);
  BOOST_CHECK_GT(f.t.pos.y, heldY);

  InputState jump = pressJump();
  jump.right = true;
  f.run(jump, kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Jump);
  BOOST_CHECK_EQUAL(f.rt.facingX, -1);
  BOOST_CHECK_LT(f.v.v.x, 0.0F);
  BOOST_CHECK_LT(f.v.v.y, 0.0F);
  BOOST_CHECK_EQUAL(Log::errorCount(), 0);
}

BOOST_AUTO_TEST_CASE(LedgeWithinReachIsGrabbed) {
  PlayerFixture f;
  f.rt.state = PlayerState::Fall;
  f.t.pos = Vec2{563.5F, 235.0F};

  f.run(holdRight(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::LedgeGrab);
  BOOST_CHECK_EQUAL(f.t.pos.y, 192.0F + f.box.h);

  f.run(holdRight(), 0.5F);
  BOOST_CHECK(f.rt.state == PlayerState::LedgeGrab);
  BOOST_CHECK_EQUAL(f.t.pos.y, 192.0F + f.box.h);

  f.run(pressJump(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Jump);
  BOOST_CHECK_LT(f.v.v.y, 0.0F);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PlayerCombat)

BOOST_AUTO_TEST_CASE(AttackInsideComboWindowChainsSecondSwing) {
  PlayerFixture f;
  f.spawnAndSettle();

  f.run(pressAttack(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Attack1);
  BOOST_CHECK(f.rt.effects.active(EffectKind::ComboWindow));
  BOOST_CHECK_EQUAL(f.rt.attackSerial, 1U);

  f.idle(0.2F);
  f.run(pressAttack(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Attack2);
  BOOST_CHECK_EQUAL(f.rt.attackSerial, 2U);
  BOOST_CHECK(!f.rt.effects.active(EffectKind::ComboWindow));

  f.idle(0.55F);
  BOOST_CHECK(f.rt.state == PlayerState::Idle);
  BOOST_CHECK(f.rt.effects.active(EffectKind::AttackCooldown));

  f.run(pressAttack(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Idle);

  f.idle(0.35F);
  f.run(pressAttack(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Attack1);
  BOOST_CHECK_EQUAL(Log::errorCount(), 0);
}

BOOST_AUTO_TEST_CASE(AttackAfterComboWindowDoesNotChain) {
  PlayerConfig cfg;
  cfg.attack.comboWindow = 0.2F;
  PlayerFixture f(cfg);
  f.spawnAndSettle();

  f.run(pressAttack(), kTick);
  f.idle(0.3F);
  BOOST_CHECK(!f.rt.effects.active(EffectKind::ComboWindow));
  f.run(pressAttack(), kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Attack1);
  BOOST_CHECK_EQUAL(f.rt.attackSerial, 1U);
}

BOOST_AUTO_TEST_CASE(AttackBoxSitsInFrontOfThePlayer) {
  PlayerFixture f;
  f.rt.facingX = 1;
  f.t.pos = Vec2{100.0F, 200.0F};
  Rect r = f.controller.attackBox(f.rt, f.t);
  BOOST_CHECK_EQUAL(r.x, 110.0F);
  BOOST_CHECK_EQUAL(r.y, 155.0F);
  BOOST_CHECK_EQUAL(r.w, 80.0F);

  f.rt.facingX = -1;
  r = f.controller.attackBox(f.rt, f.t);
  BOOST_CHECK_EQUAL(r.x + r.w, 90.0F);

  // Without animations an attack has a single frame, and it is active.
  f.rt.state = PlayerState::Attack1;
  BOOST_CHECK(f.controller.attackActive(f.rt, 0));
  BOOST_CHECK(!f.controller.attackActive(f.rt, 2));
  f.rt.state = PlayerState::Idle;
  BOOST_CHECK(!f.controller.attackActive(f.rt, 1));
}

BOOST_AUTO_TEST_CASE(HitGivesInvulnerabilityThenRecovers) {
  PlayerFixture f;
  f.spawnAndSettle();

  BOOST_CHECK(f.controller.takeDamage(f.rt, f.v, 1));
  BOOST_CHECK_EQUAL(f.rt.health, 1);
  BOOST_CHECK(f.rt.state == PlayerState::Hit);
  BOOST_CHECK(f.rt.invulnerable());
  BOOST_CHECK(!f.controller.takeDamage(f.rt, f.v, 1));
  BOOST_CHECK_EQUAL(f.rt.health, 1);

  f.idle(0.45F);
  BOOST_CHECK(f.rt.state == PlayerState::Idle);
  BOOST_CHECK(f.rt.invulnerable());

  f.idle(0.6F);
  BOOST_CHECK(!f.rt.invulnerable());

  BOOST_CHECK(f.controller.heal(f.rt, 5));
  BOOST_CHECK_EQUAL(f.rt.health, 2);
  BOOST_CHECK(!f.controller.heal(f.rt, 1));
  BOOST_CHECK_EQUAL(Log::errorCount(), 0);
}

BOOST_AUTO_TEST_CASE(RollIsInvulnerable) {
  PlayerFixture f;
  f.spawnAndSettle();
  InputState roll;
  roll.rollPressed = true;
  f.run(roll, kTick);
  BOOST_CHECK(f.rt.state == PlayerState::Roll);
  BOOST_CHECK(!f.controller.takeDamage(f.rt, f.v, 1));
  BOOST_CHECK_EQUAL(f.rt.health, 2);

  f.idle(0.6F);
  BOOST_CHECK(f.rt.state == PlayerState::Idle);
}

BOOST_AUTO_TEST_CASE(DeathWaitsForJumpBeforeAskingToRespawn) {
  PlayerFixture f;
  f.spawnAndSettle();

  BOOST_CHECK(f.controller.takeDamage(f.rt, f.v, 5));
  BOOST_CHECK(f.rt.dead());
  BOOST_CHECK_EQUAL(f.rt.health, 0);
  BOOST_CHECK(!f.controller.takeDamage(f.rt, f.v, 1));
  BOOST_CHECK(!f.controller.heal(f.rt, 1));

  // Jump during the death animation does nothing.
  f.run(pressJump(), kTick);
  f.idle(0.5F);
  BOOST_CHECK(!f.rt.deathFinished);
  BOOST_CHECK(!f.rt.respawnRequested);

  f.idle(0.6F);
  BOOST_CHECK(f.rt.deathFinished);
  BOOST_CHECK(!f.rt.respawnRequested);
  BOOST_CHECK(f.rt.dead());

  f.run(pressJump(), kTick);
  BOOST_CHECK(f.rt.respawnRequested);

  const std::uint32_t serial = f.rt.stateSerial;
  f.controller.spawn(f.rt, f.t, f.v, 100.0F, 320.0F);
  BOOST_CHECK(f.rt.state == PlayerState::Spawn);
  BOOST_CHECK_EQUAL(f.rt.health, 2);
  BOOST_CHECK(!f.rt.respawnRequested);
  BOOST_CHECK_GT(f.rt.stateSerial, serial);
  BOOST_CHECK_EQUAL(Log::errorCount(), 0);
}

BOOST_AUTO_TEST_CASE(StateDurationsFallBackWithoutAnimations) {
  PlayerConfig cfg;
  cfg.combat.hitDuration = 0.0F;
  cfg.combat.deathDuration = 0.0F;
  cfg.attack.attack1Duration = 0.25F;
  const PlayerController c(cfg);
  BOOST_CHECK_CLOSE(c.stateDuration(PlayerState::Attack1), 0.25F, 0.001);
  BOOST_CHECK_CLOSE(c.stateDuration(PlayerState::Hit), 0.4F, 0.001);
  BOOST_CHECK_CLOSE(c.stateDuration(PlayerState::Death), 1.0F, 0.001);
  BOOST_CHECK_EQUAL(c.stateDuration(PlayerState::Idle), 0.0F);
}

BOOST_AUTO_TEST_CASE(IllegalTransitionIsReportedAndRefused) {
  PlayerFixture f;
  f.rt.state = PlayerState::Idle;
  BOOST_CHECK(!f.controller.enter(f.rt, PlayerState::Attack2));
  BOOST_CHECK(f.rt.state == PlayerState::Idle);
  BOOST_CHECK_EQUAL(Log::errorCount(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
