#define BOOST_TEST_MODULE EntityAnimationsTests
#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "TestSupport.h"
#include "anim/EntityAnimations.h"
#include "util/Log.h"

using TestSupport::TagSpec;

namespace {

AnimationBinding knightBinding() {
  AnimationBinding b;
  b.entityType = "knight";
  b.sheetPath = "knight.json";
  b.scale = 1;
  b.mapping = {{"idle", "Idle"},  {"walk", "Walk"},   {"attack", "Slash"},
               {"hurt", "Hurt"},  {"roll", "Roll"},   {"crouch", "Crouch"},
               {"slide", "Slide"}};
  b.required = {"idle", "walk", "attack", "hurt", "roll"};
  b.fallbacks["hurt"] = {"attack", "idle"};
  b.fallbacks["slide"] = {"crouch", "walk"};
  return b;
}

AnimationSheetPtr knightSheet() {
  return TestSupport::makeSheet(
      {TagSpec{"Idle", 2, 100}, TagSpec{"Walk", 4, 80}, TagSpec{"Slash", 3, 60}});
}

}  // namespace

BOOST_AUTO_TEST_SUITE(StateBinding)

BOOST_AUTO_TEST_CASE(MappedStatesResolveToTheirTags) {
  EntityAnimations anims;
  BOOST_REQUIRE(anims.load(knightBinding(), knightSheet()));
  BOOST_CHECK(!anims.isPlaceholder());
  BOOST_CHECK_EQUAL(anims.entityType(), "knight");

  BOOST_CHECK(anims.hasOwnAnimation("idle"));
  BOOST_CHECK(anims.hasOwnAnimation("attack"));
  BOOST_CHECK_EQUAL(anims.frameCount("walk"), 4);
  BOOST_CHECK_EQUAL(anims.frameCount("attack"), 3);
  BOOST_CHECK_CLOSE(anims.frameDuration("walk", 1), 0.08F, 0.001);
  BOOST_CHECK_CLOSE(anims.totalDuration("attack"), 0.18F, 0.001);
  BOOST_CHECK(anims.direction("idle") == PlayDirection::Forward);
}

BOOST_AUTO_TEST_CASE(RequiredStatesFollowTheirFallbackChainFirst) {
  EntityAnimations anims;
  BOOST_REQUIRE(anims.load(knightBinding(), knightSheet()));

  BOOST_CHECK(anims.hasAnimation("hurt"));
  BOOST_CHECK(!anims.hasOwnAnimation("hurt"));
  BOOST_CHECK(anims.animation("hurt") == anims.animation("attack"));

  // "roll" has no chain of its own: the common list starts with idle.
  BOOST_CHECK(anims.animation("roll") == anims.animation("idle"));

  const std::vector<std::string> expected{"hurt", "roll"};
  BOOST_CHECK(anims.missingRequired() == expected);
}

BOOST_AUTO_TEST_CASE(RequiredStateWithoutAnyFallbackUsesBaseline) {
  AnimationBinding b = knightBinding();
  b.commonFallbacks.clear();
  b.required.push_back("dash");
  b.mapping.emplace_back("dash", "Dash");

  EntityAnimations anims;
  BOOST_REQUIRE(anims.load(b, knightSheet()));
  BOOST_CHECK(anims.animation("dash") == anims.animation("idle"));
  BOOST_CHECK(!anims.hasOwnAnimation("dash"));
}

BOOST_AUTO_TEST_CASE(OptionalStatesOnlyBorrowThroughTheirOwnChain) {
  EntityAnimations anims;
  BOOST_REQUIRE(anims.load(knightBinding(), knightSheet()));

  BOOST_CHECK(!anims.hasAnimation("crouch"));
  BOOST_CHECK_EQUAL(anims.frameCount("crouch"), 0);
  BOOST_CHECK(anims.frameSurface("crouch", 0, true) == nullptr);

  // slide -> crouch (missing) -> walk
  BOOST_CHECK(anims.animation("slide") == anims.animation("walk"));
}

BOOST_AUTO_TEST_CASE(MissingBaselineIsAConfigurationError) {
  AnimationBinding b = knightBinding();
  b.baseline = "idle";
  b.mapping[0] = {"idle", "Stand"};

  Log::resetCounts();
  EntityAnimations anims;
  BOOST_CHECK(!anims.load(b, knightSheet()));
  BOOST_CHECK(!anims.error().empty());
  BOOST_CHECK(anims.error().find("Stand") != std::string::npos);
  BOOST_CHECK_EQUAL(Log::errorCount(), 1);
  BOOST_CHECK(!anims.hasAnimation("walk"));
}

BOOST_AUTO_TEST_CASE(FacingPicksMirroredSurfaceAndPivot) {
  EntityAnimations anims;
  BOOST_REQUIRE(anims.load(knightBinding(), knightSheet()));

  const Image* right = anims.frameSurface("walk", 2, true);
  const Image* left = anims.frameSurface("walk", 2, false);
  BOOST_REQUIRE(right && left);
  BOOST_CHECK(*left == right->flippedX());

  const Pivot pr = anims.framePivot("walk", 2, true);
  const Pivot pl = anims.framePivot("walk", 2, false);
  BOOST_CHECK_CLOSE(pl.x, static_cast<float>(right->width()) - pr.x, 0.001);

  BOOST_CHECK(anims.frameSurface("walk", 4, true) == nullptr);
  BOOST_CHECK(anims.frameSurface("walk", -1, true) == nullptr);
  BOOST_CHECK_EQUAL(anims.frameDuration("walk", 9), 0.0F);
}

BOOST_AUTO_TEST_CASE(UnloadableSheetGivesPlaceholderForEveryState) {
  AnimationBinding b = knightBinding();
  b.scale = 2;
  b.placeholder.size = 10;
  b.placeholder.color = Rgba8{200, 40, 40, 255};

  AnimationSheet failed;
  failed.placeholder = true;
  failed.status = SheetStatus::MissingFile;

  EntityAnimations anims;
  BOOST_REQUIRE(anims.load(b, std::make_shared<const AnimationSheet>(failed)));
  BOOST_CHECK(anims.isPlaceholder());
  BOOST_CHECK(anims.missingRequired().empty());

  for (const auto& entry : b.mapping) {
    BOOST_CHECK(anims.hasAnimation(entry.first));
    BOOST_CHECK(!anims.hasOwnAnimation(entry.first));
    BOOST_CHECK_EQUAL(anims.frameCount(entry.first), 1);
  }
  const Image* img = anims.frameSurface("attack", 0, true);
  BOOST_REQUIRE(img);
  BOOST_CHECK_EQUAL(img->width(), 20);
  BOOST_CHECK(img->at(3, 3) == (Rgba8{200, 40, 40, 255}));
  const Pivot p = anims.framePivot("attack", 0, true);
  BOOST_CHECK_CLOSE(p.x, 10.0F, 0.001);
  BOOST_CHECK_CLOSE(p.y, 18.0F, 0.001);
}

BOOST_AUTO_TEST_CASE(NullSheetAlsoMeansPlaceholder) {
  EntityAnimations anims;
  BOOST_CHECK(anims.load(knightBinding(), nullptr));
  BOOST_CHECK(anims.isPlaceholder());
  BOOST_CHECK(anims.hasAnimation("idle"));
}

BOOST_AUTO_TEST_CASE(UnmappedStateUsesItsOwnNameAsTag) {
  const AnimationBinding b = knightBinding();
  BOOST_CHECK_EQUAL(b.tagFor("attack"), "Slash");
  BOOST_CHECK_EQUAL(b.tagFor("swim"), "swim");
}

BOOST_AUTO_TEST_SUITE_END()
