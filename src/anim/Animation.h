#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "anim/Image.h"
#include "anim/SheetDescriptor.h"

struct AnimationFrame {
  Image right;  // as authored
  Image left;   // horizontally mirrored
  Pivot pivotRight;
  Pivot pivotLeft;  // x = width - pivotRight.x
  IntRect source;   // cell in the sheet image (unscaled)
};

struct Animation {
  std::string name;
  std::vector<AnimationFrame> frames;
  std::vector<float> durations;  // seconds, one per frame
  PlayDirection direction = PlayDirection::Forward;
  bool placeholder = false;

  [[nodiscard]] int frameCount() const { return static_cast<int>(frames.size()); }
  [[nodiscard]] bool valid() const { return !frames.empty() && frames.size() == durations.size(); }

  [[nodiscard]] float totalDuration() const {
    float total = 0.0F;
    for (float d : durations)
      total += d;
    return total;
  }
};

using AnimationPtr = std::shared_ptr<const Animation>;

// Every tag of one sheet, keyed by tag name. Read-only once built; shared between entities.
struct AnimationSheet {
  std::string path;
  int scale = 1;
  bool placeholder = false;
  SheetStatus status = SheetStatus::Ok;
  std::map<std::string, AnimationPtr, std::less<>> animations;

  [[nodiscard]] AnimationPtr find(std::string_view tag) const {
    auto it = animations.find(tag);
    return (it != animations.end()) ? it->second : nullptr;
  }
};

using AnimationSheetPtr = std::shared_ptr<const AnimationSheet>;
