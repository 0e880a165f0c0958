#define BOOST_TEST_MODULE AnimationLoaderTests
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <string>

#include "TestSupport.h"
#include "anim/AnimationLoader.h"
#include "anim/AssetRegistry.h"

using TestSupport::TagSpec;
using TestSupport::TempDir;

namespace {

bool mirrored(const Image& a, const Image& b) {
  if (a.width() != b.width() || a.height() != b.height())
    return false;
  for (int y = 0; y < a.height(); ++y) {
    for (int x = 0; x < a.width(); ++x) {
      if (!(a.at(x, y) == b.at(a.width() - 1 - x, y)))
        return false;
    }
  }
  return true;
}

// Two tags over five 8x8 frames, written as descriptor + PPM image.
std::string writeStrip(const TempDir& dir, const std::string& stem, bool withImageKey) {
  const std::vector<TagSpec> tags{TagSpec{"Idle", 2, 150}, TagSpec{"Slash 1", 3, 50}};
  Image img = TestSupport::stripImage(5, 8, 8);
  img.set(0, 0, Rgba8{255, 0, 0, 255});  // makes frame 0 asymmetric
  const std::string imageName = stem + (withImageKey ? ".ppm" : ".png");
  TestSupport::writePpm(dir.file(imageName), img);
  const auto json = TestSupport::stripDescriptor(tags, 8, 8, withImageKey ? imageName : "");
  const std::string jsonPath = dir.file(stem + ".json");
  TestSupport::writeText(jsonPath, json.dump(2));
  return jsonPath;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(AnimationLoading)

BOOST_AUTO_TEST_CASE(LoadsTagsWithTimingAndScale) {
  TempDir dir("loader");
  const std::string path = writeStrip(dir, "hero", true);

  AnimationSheet sheet;
  BOOST_REQUIRE(AnimationLoader::load(path, 2, sheet) == SheetStatus::Ok);
  BOOST_CHECK_EQUAL(sheet.scale, 2);
  BOOST_REQUIRE_EQUAL(sheet.animations.size(), 2U);

  const AnimationPtr idle = sheet.find("Idle");
  const AnimationPtr slash = sheet.find("Slash 1");
  BOOST_REQUIRE(idle && slash);
  BOOST_CHECK(idle->valid());
  BOOST_CHECK_EQUAL(idle->frameCount(), 2);
  BOOST_CHECK_EQUAL(slash->frameCount(), 3);
  BOOST_CHECK_EQUAL(idle->durations.size(), 2U);
  BOOST_CHECK_CLOSE(idle->durations[0], 0.15F, 0.001);
  BOOST_CHECK_CLOSE(slash->totalDuration(), 0.15F, 0.001);

  // Frame 2 of the strip is the first frame of "Slash 1".
  const AnimationFrame& first = slash->frames.front();
  BOOST_CHECK_EQUAL(first.source.x, 16);
  BOOST_CHECK_EQUAL(first.right.width(), 16);
  BOOST_CHECK_EQUAL(first.right.height(), 16);
  BOOST_CHECK(first.right.at(5, 5) == TestSupport::frameColor(2));

  // No pivot slice: bottom centre, scaled.
  BOOST_CHECK_CLOSE(first.pivotRight.x, 8.0F, 0.001);
  BOOST_CHECK_CLOSE(first.pivotRight.y, 16.0F, 0.001);
}

BOOST_AUTO_TEST_CASE(LeftFramesMirrorRightFrames) {
  TempDir dir("mirror");
  const std::string path = writeStrip(dir, "hero", true);

  AnimationSheet sheet;
  BOOST_REQUIRE(AnimationLoader::load(path, 3, sheet) == SheetStatus::Ok);
  for (const auto& entry : sheet.animations) {
    for (const AnimationFrame& f : entry.second->frames) {
      BOOST_CHECK(mirrored(f.right, f.left));
      BOOST_CHECK_CLOSE(f.pivotLeft.x, static_cast<float>(f.right.width()) - f.pivotRight.x,
                        0.001);
      BOOST_CHECK_CLOSE(f.pivotLeft.y, f.pivotRight.y, 0.001);
    }
  }
  const AnimationFrame& marked = sheet.find("Idle")->frames.front();
  BOOST_CHECK(marked.right.at(0, 0) == (Rgba8{255, 0, 0, 255}));
  BOOST_CHECK(marked.left.at(marked.left.width() - 1, 0) == (Rgba8{255, 0, 0, 255}));
}

BOOST_AUTO_TEST_CASE(ImageDefaultsToDescriptorStem) {
  TempDir dir("stem");
  const std::string path = writeStrip(dir, "nokey", false);

  AnimationSheet sheet;
  BOOST_CHECK(AnimationLoader::load(path, 1, sheet) == SheetStatus::Ok);
  BOOST_CHECK(sheet.find("Idle") != nullptr);
}

BOOST_AUTO_TEST_CASE(FailuresLeaveTheSheetUntouched) {
  TempDir dir("fail");
  AnimationSheet sheet;
  sheet.path = "untouched";

  BOOST_CHECK(AnimationLoader::load(dir.file("missing.json"), 2, sheet) ==
              SheetStatus::MissingFile);

  TestSupport::writeText(dir.file("broken.json"), "{\"frames\": 3");
  BOOST_CHECK(AnimationLoader::load(dir.file("broken.json"), 2, sheet) ==
              SheetStatus::MalformedDescriptor);

  const auto json = TestSupport::stripDescriptor({TagSpec{"Idle", 1}}, 8, 8, "gone.png");
  TestSupport::writeText(dir.file("noimage.json"), json.dump());
  BOOST_CHECK(AnimationLoader::load(dir.file("noimage.json"), 2, sheet) ==
              SheetStatus::MissingImage);

  BOOST_CHECK_EQUAL(sheet.path, "untouched");
  BOOST_CHECK(sheet.animations.empty());
}

BOOST_AUTO_TEST_CASE(TrimmedFramesKeepUntrimmedCoordinates) {
  const std::string text = R"({
    "frames": [{
      "frame": {"x": 0, "y": 0, "w": 2, "h": 2},
      "trimmed": true,
      "spriteSourceSize": {"x": 3, "y": 4, "w": 2, "h": 2},
      "sourceSize": {"w": 8, "h": 8}
    }],
    "meta": {"frameTags": [{"name": "Dot", "from": 0, "to": 0}]}
  })";
  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(text, "trim.json") == SheetStatus::Ok);

  const Image image = Image::solid(2, 2, Rgba8{10, 20, 30, 255});
  const AnimationSheet sheet = AnimationLoader::build(desc, image, 1);
  const AnimationPtr dot = sheet.find("Dot");
  BOOST_REQUIRE(dot);
  const Image& f = dot->frames.front().right;
  BOOST_CHECK_EQUAL(f.width(), 8);
  BOOST_CHECK_EQUAL(f.height(), 8);
  BOOST_CHECK(f.at(3, 4) == (Rgba8{10, 20, 30, 255}));
  BOOST_CHECK(f.at(4, 5) == (Rgba8{10, 20, 30, 255}));
  BOOST_CHECK_EQUAL(f.at(0, 0).a, 0);
  BOOST_CHECK_CLOSE(dot->frames.front().pivotRight.x, 4.0F, 0.001);
  BOOST_CHECK_CLOSE(dot->frames.front().pivotRight.y, 8.0F, 0.001);
}

BOOST_AUTO_TEST_CASE(SheetWithoutTagsHasOneDefaultAnimation) {
  const std::string text = R"({"frames": [
    {"frame": {"x": 0, "y": 0, "w": 4, "h": 4}, "duration": 40},
    {"frame": {"x": 4, "y": 0, "w": 4, "h": 4}, "duration": 60}
  ]})";
  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(text, "untagged.json") == SheetStatus::Ok);
  const AnimationSheet sheet = AnimationLoader::build(desc, TestSupport::stripImage(2, 4, 4), 1);
  BOOST_REQUIRE_EQUAL(sheet.animations.size(), 1U);
  const AnimationPtr def = sheet.find("default");
  BOOST_REQUIRE(def);
  BOOST_CHECK_EQUAL(def->frameCount(), 2);
  BOOST_CHECK_CLOSE(def->totalDuration(), 0.1F, 0.001);
}

BOOST_AUTO_TEST_CASE(LoadingTwiceGivesIdenticalAnimations) {
  TempDir dir("twice");
  const std::string path = writeStrip(dir, "hero", true);

  AnimationSheet a;
  AnimationSheet b;
  BOOST_REQUIRE(AnimationLoader::load(path, 2, a) == SheetStatus::Ok);
  BOOST_REQUIRE(AnimationLoader::load(path, 2, b) == SheetStatus::Ok);
  BOOST_REQUIRE_EQUAL(a.animations.size(), b.animations.size());
  for (const auto& [name, anim] : a.animations) {
    const AnimationPtr other = b.find(name);
    BOOST_REQUIRE(other);
    BOOST_CHECK_EQUAL(anim->frameCount(), other->frameCount());
    BOOST_CHECK(anim->durations == other->durations);
    for (int i = 0; i < anim->frameCount(); ++i) {
      const auto idx = static_cast<std::size_t>(i);
      BOOST_CHECK(anim->frames[idx].pivotRight == other->frames[idx].pivotRight);
      BOOST_CHECK(anim->frames[idx].pivotLeft == other->frames[idx].pivotLeft);
      BOOST_CHECK(anim->frames[idx].right == other->frames[idx].right);
    }
  }
}

BOOST_AUTO_TEST_CASE(PlaceholderIsOneStaticFrame) {
  const AnimationPtr p = AnimationLoader::makePlaceholder("player:placeholder", 120, 120,
                                                         Rgba8{80, 150, 255, 255},
                                                         Pivot{60.0F, 118.0F}, 0.1F);
  BOOST_REQUIRE(p);
  BOOST_CHECK(p->placeholder);
  BOOST_CHECK(p->valid());
  BOOST_CHECK_EQUAL(p->frameCount(), 1);
  BOOST_CHECK(p->frames[0].right.at(10, 10) == (Rgba8{80, 150, 255, 255}));
  BOOST_CHECK_CLOSE(p->frames[0].pivotLeft.x, 60.0F, 0.001);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AssetRegistrySharing)

BOOST_AUTO_TEST_CASE(SheetsAreSharedPerPathAndScale) {
  TempDir dir("registry");
  const std::string path = writeStrip(dir, "hero", true);

  AssetRegistry assets;
  const AnimationSheetPtr a = assets.sheet(path, 2);
  const AnimationSheetPtr b = assets.sheet(path, 2);
  const AnimationSheetPtr c = assets.sheet(path, 1);
  BOOST_CHECK(a == b);
  BOOST_CHECK(a != c);
  BOOST_CHECK_EQUAL(assets.size(), 2U);
  BOOST_CHECK_EQUAL(assets.loadCount(), 2);
  BOOST_CHECK(!a->placeholder);

  const AnimationSheetPtr reloaded = assets.reload(path, 2);
  BOOST_CHECK(reloaded != a);
  BOOST_CHECK_EQUAL(a->animations.size(), reloaded->animations.size());

  assets.clear();
  BOOST_CHECK_EQUAL(assets.size(), 0U);
}

BOOST_AUTO_TEST_CASE(MissingSheetComesBackAsPlaceholder) {
  AssetRegistry assets;
  const AnimationSheetPtr s = assets.sheet("/nonexistent/darkvania/enemy.json", 2);
  BOOST_REQUIRE(s);
  BOOST_CHECK(s->placeholder);
  BOOST_CHECK(s->status == SheetStatus::MissingFile);
  BOOST_CHECK(s == assets.sheet("/nonexistent/darkvania/enemy.json", 2));
}

BOOST_AUTO_TEST_SUITE_END()
