#pragma once

#include <map>
#include <string>
#include <utility>

#include "anim/Animation.h"

// Owns every loaded animation sheet. Entities of the same type share one read-only sheet;
// nothing else caches sheets, so reload() and clear() are the only invalidation points.
class AssetRegistry {
 public:
  // Never null. A sheet that fails to load comes back with placeholder = true and the
  // failure status, and the failure is logged once per (path, scale).
  AnimationSheetPtr sheet(const std::string& jsonPath, int scale);

  // Drops the cached sheet and loads it again. Holders of the old pointer keep it alive.
  AnimationSheetPtr reload(const std::string& jsonPath, int scale);

  void clear();

  [[nodiscard]] std::size_t size() const { return sheets_.size(); }
  [[nodiscard]] int loadCount() const { return loads_; }

 private:
  AnimationSheetPtr loadSheet(const std::string& jsonPath, int scale);

  std::map<std::pair<std::string, int>, AnimationSheetPtr> sheets_;
  int loads_ = 0;
};
