#define BOOST_TEST_MODULE PhysicsTests
#include <boost/test/unit_test.hpp>

#include <optional>

#include "TestSupport.h"
#include "ecs/Components.h"
#include "world/Physics.h"

namespace {

// 16 px tiles: floor top at y = 64, platform top at y = 32 over columns 3-5.
TileMap room() {
  return TestSupport::makeMap({
      "##########",
      "#........#",
      "#..===...#",
      "#........#",
      "##########",
      "##########",
  });
}

const AABB kBox{8.0F, 12.0F};

Transform at(float x, float y) {
  Transform t;
  t.pos = Vec2{x, y};
  return t;
}

Velocity moving(float vx, float vy) {
  Velocity v;
  v.v = Vec2{vx, vy};
  return v;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(TileCollisionResolution)

BOOST_AUTO_TEST_CASE(BodyRectHangsFromTheFeet) {
  const Rect r = Physics::bodyRect(at(40.0F, 64.0F), kBox);
  BOOST_CHECK_EQUAL(r.x, 36.0F);
  BOOST_CHECK_EQUAL(r.y, 52.0F);
  BOOST_CHECK_EQUAL(r.w, 8.0F);
  BOOST_CHECK_EQUAL(r.h, 12.0F);
}

BOOST_AUTO_TEST_CASE(GravityIsCappedAtMaxFallSpeed) {
  Velocity v = moving(0.0F, 0.0F);
  Physics::applyGravity(v, 1000.0F, 300.0F, 0.1F);
  BOOST_CHECK_CLOSE(v.v.y, 100.0F, 0.001);
  Physics::applyGravity(v, 1000.0F, 300.0F, 0.5F);
  BOOST_CHECK_EQUAL(v.v.y, 300.0F);
}

BOOST_AUTO_TEST_CASE(FallingBodyLandsOnPlatformTop) {
  const TileMap map = room();
  Transform t = at(72.0F, 28.0F);
  Velocity v = moving(0.0F, 100.0F);
  const Physics::StepResult r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, false);
  BOOST_CHECK(r.onGround);
  BOOST_CHECK(r.landed);
  BOOST_CHECK(r.ground == TileCollision::Platform);
  BOOST_CHECK_EQUAL(t.pos.y, 32.0F);
  BOOST_CHECK_EQUAL(v.v.y, 0.0F);
}

BOOST_AUTO_TEST_CASE(PlatformLetsBodiesThroughFromBelow) {
  const TileMap map = room();
  Transform t = at(72.0F, 44.0F);
  Velocity v = moving(0.0F, -150.0F);
  Physics::StepResult r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, false);
  BOOST_CHECK(!r.hitCeiling);
  BOOST_CHECK_CLOSE(t.pos.y, 29.0F, 0.001);

  // Once the feet have cleared the top, falling again lands on it.
  v = moving(0.0F, 100.0F);
  r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, false);
  BOOST_CHECK(r.onGround);
  BOOST_CHECK_EQUAL(t.pos.y, 32.0F);
}

BOOST_AUTO_TEST_CASE(PlatformIgnoresFeetAlreadyBelowItsTop) {
  const TileMap map = room();
  Transform t = at(72.0F, 40.0F);
  Velocity v = moving(0.0F, 50.0F);
  const Physics::StepResult r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, false);
  BOOST_CHECK(!r.onGround);
  BOOST_CHECK_CLOSE(t.pos.y, 45.0F, 0.001);
}

BOOST_AUTO_TEST_CASE(FastFallDoesNotTunnelThroughTheFloor) {
  const TileMap map = room();
  Transform t = at(40.0F, 20.0F);
  Velocity v = moving(0.0F, 5000.0F);
  const Physics::StepResult r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, false);
  BOOST_CHECK(r.onGround);
  BOOST_CHECK(r.ground == TileCollision::Solid);
  BOOST_CHECK_EQUAL(t.pos.y, 64.0F);
}

BOOST_AUTO_TEST_CASE(WallsStopHorizontalMotion) {
  const TileMap map = room();

  Transform t = at(130.0F, 64.0F);
  Velocity v = moving(1000.0F, 0.0F);
  Physics::StepResult r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, true);
  BOOST_CHECK_EQUAL(r.wallHitX, 1);
  BOOST_CHECK_EQUAL(t.pos.x, 140.0F);
  BOOST_CHECK_EQUAL(v.v.x, 0.0F);
  BOOST_CHECK(r.onGround);
  BOOST_CHECK(!r.landed);

  t = at(24.0F, 64.0F);
  v = moving(-1000.0F, 0.0F);
  r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, true);
  BOOST_CHECK_EQUAL(r.wallHitX, -1);
  BOOST_CHECK_EQUAL(t.pos.x, 20.0F);
}

BOOST_AUTO_TEST_CASE(CeilingStopsAJump) {
  const TileMap map = room();
  Transform t = at(40.0F, 64.0F);
  Velocity v = moving(0.0F, -1000.0F);
  const Physics::StepResult r = Physics::moveAndCollide(map, t, v, kBox, 0.1F, true);
  BOOST_CHECK(r.hitCeiling);
  BOOST_CHECK_EQUAL(t.pos.y, 28.0F);
  BOOST_CHECK_EQUAL(v.v.y, 0.0F);
  BOOST_CHECK(!r.onGround);
}

BOOST_AUTO_TEST_CASE(GroundAndWallProbes) {
  const TileMap map = room();
  BOOST_CHECK(Physics::groundBelow(map, at(40.0F, 64.0F), kBox));
  BOOST_CHECK(Physics::groundBelow(map, at(72.0F, 32.0F), kBox));
  BOOST_CHECK(!Physics::groundBelow(map, at(40.0F, 58.0F), kBox));

  const Transform nearWall = at(140.0F, 64.0F);
  BOOST_CHECK_EQUAL(Physics::wallContacts(map, nearWall, kBox, 1), 3);
  BOOST_CHECK(Physics::touchingWall(map, nearWall, kBox, 1));
  BOOST_CHECK(!Physics::touchingWall(map, nearWall, kBox, -1));
  BOOST_CHECK_EQUAL(Physics::wallContacts(map, nearWall, kBox, 0), 0);
}

BOOST_AUTO_TEST_CASE(LedgeNeedsFreeSpaceAbove) {
  const TileMap map = TestSupport::makeMap({
      "..........",
      "......####",
      "......#...",
      "......#...",
      "##########",
  });
  const Transform t = at(92.0F, 64.0F);
  const std::optional<float> ledge = Physics::ledgeAt(map, t, kBox, 1, 40.0F);
  BOOST_REQUIRE(ledge.has_value());
  BOOST_CHECK_EQUAL(*ledge, 16.0F);

  BOOST_CHECK(!Physics::ledgeAt(map, t, kBox, 1, 20.0F).has_value());
  BOOST_CHECK(!Physics::ledgeAt(map, t, kBox, -1, 10.0F).has_value());
  BOOST_CHECK(!Physics::ledgeAt(map, t, kBox, 0, 40.0F).has_value());
}

BOOST_AUTO_TEST_CASE(GroundAheadSeesPitEdges) {
  const TileMap map = TestSupport::makeMap({
      "..........",
      "..........",
      "###...####",
  });
  BOOST_CHECK(Physics::groundAhead(map, at(24.0F, 32.0F), kBox, 1));
  BOOST_CHECK(!Physics::groundAhead(map, at(42.0F, 32.0F), kBox, 1));
  BOOST_CHECK(Physics::groundAhead(map, at(42.0F, 32.0F), kBox, -1));
}

BOOST_AUTO_TEST_SUITE_END()
