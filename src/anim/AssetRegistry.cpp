#include "anim/AssetRegistry.h"

#include <memory>

#include "anim/AnimationLoader.h"
#include "util/Log.h"

AnimationSheetPtr AssetRegistry::sheet(const std::string& jsonPath, int scale) {
  auto it = sheets_.find({jsonPath, scale});
  if (it != sheets_.end())
    return it->second;

  AnimationSheetPtr loaded = loadSheet(jsonPath, scale);
  sheets_.emplace(std::make_pair(jsonPath, scale), loaded);
  return loaded;
}

AnimationSheetPtr AssetRegistry::reload(const std::string& jsonPath, int scale) {
  sheets_.erase({jsonPath, scale});
  return sheet(jsonPath, scale);
}

void AssetRegistry::clear() {
  sheets_.clear();
}

AnimationSheetPtr AssetRegistry::loadSheet(const std::string& jsonPath, int scale) {
  ++loads_;
  auto out = std::make_shared<AnimationSheet>();
  const SheetStatus status = AnimationLoader::load(jsonPath, scale, *out);
  if (status != SheetStatus::Ok) {
    Log::warnf(jsonPath.c_str(), "animation sheet unavailable ({}); using placeholder",
               toString(status));
    out = std::make_shared<AnimationSheet>();
    out->path = jsonPath;
    out->scale = scale;
    out->placeholder = true;
    out->status = status;
  }
  return out;
}
