#define BOOST_TEST_MODULE SheetDescriptorTests
#include <boost/test/unit_test.hpp>

#include <string>

#include "TestSupport.h"
#include "anim/SheetDescriptor.h"
#include "util/Log.h"

using TestSupport::TagSpec;

BOOST_AUTO_TEST_SUITE(SheetDescriptorParsing)

BOOST_AUTO_TEST_CASE(HashFramesKeepFileOrder) {
  // Names that would sort differently than they appear.
  const std::string text = R"({
    "frames": {
      "zeta.aseprite": {"frame": {"x": 0, "y": 0, "w": 4, "h": 4}, "duration": 120},
      "alpha.aseprite": {"frame": {"x": 4, "y": 0, "w": 4, "h": 4}, "duration": 80},
      "mid.aseprite": {"frame": {"x": 8, "y": 0, "w": 4, "h": 4}}
    },
    "meta": {"image": "strip.png"}
  })";

  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(text, "hash.json") == SheetStatus::Ok);
  BOOST_REQUIRE_EQUAL(desc.frames.size(), 3U);
  BOOST_CHECK_EQUAL(desc.frames[0].name, "zeta.aseprite");
  BOOST_CHECK_EQUAL(desc.frames[1].name, "alpha.aseprite");
  BOOST_CHECK_EQUAL(desc.frames[2].name, "mid.aseprite");
  BOOST_CHECK_EQUAL(desc.frames[0].durationMs, 120);
  BOOST_CHECK_EQUAL(desc.frames[1].rect.x, 4);
  BOOST_CHECK_EQUAL(desc.image, "strip.png");
}

BOOST_AUTO_TEST_CASE(ArrayFramesAndDurationDefaults) {
  const std::string text = R"({
    "frames": [
      {"filename": "a", "frame": {"x": 0, "y": 0, "w": 2, "h": 2}},
      {"filename": "b", "frame": {"x": 2, "y": 0, "w": 2, "h": 2}, "duration": 0}
    ]
  })";

  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(text, "array.json") == SheetStatus::Ok);
  BOOST_REQUIRE_EQUAL(desc.frames.size(), 2U);
  BOOST_CHECK_EQUAL(desc.frames[0].name, "a");
  BOOST_CHECK_EQUAL(desc.frames[0].durationMs, 100);  // missing
  BOOST_CHECK_EQUAL(desc.frames[1].durationMs, 1);    // clamped up
  BOOST_CHECK(desc.tags.empty());
  BOOST_CHECK(desc.image.empty());
}

BOOST_AUTO_TEST_CASE(TagsAreInclusiveAndZeroBased) {
  const auto json = TestSupport::stripDescriptor(
      {TagSpec{"Idle", 2}, TagSpec{"Slash 1", 3, 100, "pingpong"}}, 4, 4);

  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(json.dump(), "tags.json") == SheetStatus::Ok);
  const SheetDescriptor::Tag* idle = desc.findTag("Idle");
  const SheetDescriptor::Tag* slash = desc.findTag("Slash 1");
  BOOST_REQUIRE(idle != nullptr);
  BOOST_REQUIRE(slash != nullptr);
  BOOST_CHECK_EQUAL(idle->from, 0);
  BOOST_CHECK_EQUAL(idle->to, 1);
  BOOST_CHECK_EQUAL(slash->from, 2);
  BOOST_CHECK_EQUAL(slash->to, 4);
  BOOST_CHECK(slash->direction == PlayDirection::PingPong);
  BOOST_CHECK(desc.findTag("slash 1") == nullptr);
}

BOOST_AUTO_TEST_CASE(BadTagsAreSkippedWithAWarning) {
  const std::string text = R"({
    "frames": [
      {"frame": {"x": 0, "y": 0, "w": 2, "h": 2}},
      {"frame": {"x": 2, "y": 0, "w": 2, "h": 2}}
    ],
    "meta": {"frameTags": [
      {"name": "backwards", "from": 1, "to": 0},
      {"name": "overflow", "from": 0, "to": 5},
      {"name": "odd", "from": 0, "to": 1, "direction": "sideways"}
    ]}
  })";

  Log::resetCounts();
  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(text, "bad-tags.json") == SheetStatus::Ok);
  BOOST_REQUIRE_EQUAL(desc.tags.size(), 1U);
  BOOST_CHECK_EQUAL(desc.tags[0].name, "odd");
  BOOST_CHECK(desc.tags[0].direction == PlayDirection::Forward);
  BOOST_CHECK_EQUAL(Log::warningCount(), 3);
}

BOOST_AUTO_TEST_CASE(PivotSliceKeysApplyFromTheirFrame) {
  const std::string text = R"({
    "frames": [
      {"frame": {"x": 0, "y": 0, "w": 8, "h": 8}},
      {"frame": {"x": 8, "y": 0, "w": 8, "h": 8}},
      {"frame": {"x": 16, "y": 0, "w": 8, "h": 8}}
    ],
    "meta": {"slices": [
      {"name": "Hitbox", "keys": [{"frame": 0, "bounds": {"x": 0, "y": 0, "w": 1, "h": 1}}]},
      {"name": "Pivot", "keys": [
        {"frame": 2, "bounds": {"x": 3, "y": 6, "w": 1, "h": 1}, "pivot": {"x": 1, "y": 1}},
        {"frame": 0, "bounds": {"x": 2, "y": 5, "w": 1, "h": 1}, "pivot": {"x": 0, "y": 2}}
      ]}
    ]}
  })";

  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(text, "pivot.json") == SheetStatus::Ok);
  BOOST_REQUIRE_EQUAL(desc.pivotKeys.size(), 2U);

  const auto p0 = desc.pivotForFrame(0);
  const auto p1 = desc.pivotForFrame(1);
  const auto p2 = desc.pivotForFrame(2);
  BOOST_REQUIRE(p0 && p1 && p2);
  BOOST_CHECK(*p0 == (Pivot{2.0F, 7.0F}));
  BOOST_CHECK(*p1 == (Pivot{2.0F, 7.0F}));
  BOOST_CHECK(*p2 == (Pivot{4.0F, 7.0F}));
}

BOOST_AUTO_TEST_CASE(MalformedInputIsReportedNotThrown) {
  SheetDescriptor desc;
  BOOST_CHECK(desc.parse("{ not json", "broken.json") == SheetStatus::MalformedDescriptor);
  BOOST_CHECK(desc.parse(R"({"meta": {}})", "noframes.json") ==
              SheetStatus::MalformedDescriptor);
  BOOST_CHECK(desc.parse(R"({"frames": []})", "empty.json") == SheetStatus::MalformedDescriptor);
  BOOST_CHECK(desc.parse(R"({"frames": [{"frame": {"x": 0}}]})", "partial.json") ==
              SheetStatus::MalformedDescriptor);
  BOOST_CHECK(desc.loadFromJson("/nonexistent/darkvania/sheet.json") == SheetStatus::MissingFile);
}

BOOST_AUTO_TEST_CASE(FailedParseLeavesPreviousContents) {
  SheetDescriptor desc;
  BOOST_REQUIRE(desc.parse(TestSupport::stripDescriptor({TagSpec{"Idle", 2}}, 4, 4).dump(),
                           "ok.json") == SheetStatus::Ok);
  BOOST_CHECK(desc.parse("[]", "array-root.json") == SheetStatus::MalformedDescriptor);
  BOOST_CHECK_EQUAL(desc.frames.size(), 2U);
  BOOST_CHECK(desc.findTag("Idle") != nullptr);
}

BOOST_AUTO_TEST_SUITE_END()
