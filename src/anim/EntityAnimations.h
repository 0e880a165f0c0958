#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "anim/Animation.h"
#include "anim/Image.h"

// How one entity type names its animations: logical state -> sheet tag, plus the states it
// cannot live without and what to show instead when a tag is missing.
struct AnimationBinding {
  std::string entityType;
  std::string sheetPath;
  int scale = 2;

  std::vector<std::pair<std::string, std::string>> mapping;  // state -> tag
  std::vector<std::string> required;
  std::unordered_map<std::string, std::vector<std::string>> fallbacks;
  std::vector<std::string> commonFallbacks{"idle", "walk", "run"};
  std::string baseline = "idle";

  // Shown for every state when the sheet could not be loaded. Unscaled pixels.
  struct Placeholder {
    int size = 60;
    Rgba8 color{80, 150, 255, 255};
    float duration = 0.1F;
  } placeholder;

  [[nodiscard]] std::string tagFor(std::string_view state) const;
};

// Resolved state -> animation table for one entity. Holds shared read-only frame data.
class EntityAnimations {
 public:
  // False means a configuration error (baseline missing from a real sheet); see error().
  bool load(const AnimationBinding& binding, const AnimationSheetPtr& sheet);

  [[nodiscard]] bool hasAnimation(std::string_view state) const;
  // Bound to its own tag in a real sheet, not borrowed through a fallback.
  [[nodiscard]] bool hasOwnAnimation(std::string_view state) const;
  [[nodiscard]] int frameCount(std::string_view state) const;
  [[nodiscard]] float frameDuration(std::string_view state, int index) const;
  [[nodiscard]] const Image* frameSurface(std::string_view state, int index, bool facingRight) const;
  [[nodiscard]] Pivot framePivot(std::string_view state, int index, bool facingRight) const;
  [[nodiscard]] float totalDuration(std::string_view state) const;
  [[nodiscard]] PlayDirection direction(std::string_view state) const;
  [[nodiscard]] AnimationPtr animation(std::string_view state) const;

  // Required states that had to borrow another state's animation.
  [[nodiscard]] const std::vector<std::string>& missingRequired() const { return missingRequired_; }
  [[nodiscard]] bool isPlaceholder() const { return placeholder_; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] const std::string& entityType() const { return entityType_; }

 private:
  [[nodiscard]] const AnimationFrame* frame(std::string_view state, int index) const;
  bool bindFirstOf(const std::string& state, const std::vector<std::string>& candidates);

  std::map<std::string, AnimationPtr, std::less<>> states_;
  std::set<std::string, std::less<>> borrowed_;
  std::vector<std::string> missingRequired_;
  std::string error_;
  std::string entityType_;
  AnimationSheetPtr sheet_;
  bool placeholder_ = false;
};
