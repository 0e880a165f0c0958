#include "anim/AnimationLoader.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "util/Log.h"
#include "util/Paths.h"

namespace {

AnimationFrame sliceFrame(const SheetDescriptor& desc, const Image& image, int index, int scale) {
  const SheetDescriptor::Frame& src = desc.frames[static_cast<std::size_t>(index)];

  Image cell = image.crop(src.rect.x, src.rect.y, src.rect.w, src.rect.h);
  if (src.trimmed || src.sourceW != src.rect.w || src.sourceH != src.rect.h) {
    // Put trimmed pixels back where they were so pivots stay in untrimmed coordinates.
    Image canvas(src.sourceW, src.sourceH);
    canvas.blit(cell, src.spriteSource.x, src.spriteSource.y);
    cell = std::move(canvas);
  }

  Pivot pivot{static_cast<float>(cell.width()) * 0.5F, static_cast<float>(cell.height())};
  if (auto p = desc.pivotForFrame(index)) {
    pivot = *p;
  }

  const float s = static_cast<float>(scale);
  AnimationFrame out{};
  out.right = cell.scaledNearest(scale);
  out.left = out.right.flippedX();
  out.pivotRight = Pivot{pivot.x * s, pivot.y * s};
  out.pivotLeft = Pivot{static_cast<float>(out.right.width()) - out.pivotRight.x, out.pivotRight.y};
  out.source = src.rect;
  return out;
}

AnimationPtr sliceRange(const SheetDescriptor& desc,
                        const Image& image,
                        int scale,
                        const std::string& name,
                        int from,
                        int to,
                        PlayDirection direction) {
  auto anim = std::make_shared<Animation>();
  anim->name = name;
  anim->direction = direction;
  anim->frames.reserve(static_cast<std::size_t>(to - from + 1));
  anim->durations.reserve(static_cast<std::size_t>(to - from + 1));
  for (int i = from; i <= to; ++i) {
    anim->frames.push_back(sliceFrame(desc, image, i, scale));
    anim->durations.push_back(
        static_cast<float>(desc.frames[static_cast<std::size_t>(i)].durationMs) / 1000.0F);
  }
  return anim;
}

}  // namespace

namespace AnimationLoader {

SheetStatus load(const std::string& jsonPath, int scale, AnimationSheet& out) {
  SheetDescriptor desc;
  const SheetStatus status = desc.loadFromJson(jsonPath);
  if (status != SheetStatus::Ok) {
    return status;
  }

  const std::string imagePath = desc.image.empty()
                                    ? Paths::defaultSheetImagePath(jsonPath)
                                    : Paths::siblingPath(jsonPath, desc.image);
  Image image;
  std::string error;
  if (!Image::loadFile(imagePath, image, &error)) {
    Log::warnf(jsonPath.c_str(), "sheet image '{}' failed to load: {}", imagePath, error);
    return SheetStatus::MissingImage;
  }

  out = build(desc, image, scale, jsonPath);
  return SheetStatus::Ok;
}

AnimationSheet build(const SheetDescriptor& desc,
                     const Image& image,
                     int scale,
                     const std::string& path) {
  AnimationSheet sheet{};
  sheet.path = path;
  sheet.scale = std::max(1, scale);
  sheet.status = SheetStatus::Ok;

  for (const SheetDescriptor::Frame& f : desc.frames) {
    if (f.rect.x < 0 || f.rect.y < 0 || f.rect.x + f.rect.w > image.width() ||
        f.rect.y + f.rect.h > image.height()) {
      Log::warnf(path.empty() ? nullptr : path.c_str(),
                 "frame '{}' ({},{} {}x{}) lies outside the {}x{} sheet image", f.name, f.rect.x,
                 f.rect.y, f.rect.w, f.rect.h, image.width(), image.height());
    }
  }

  if (desc.tags.empty()) {
    sheet.animations["default"] =
        sliceRange(desc, image, sheet.scale, "default", 0,
                   static_cast<int>(desc.frames.size()) - 1, PlayDirection::Forward);
    return sheet;
  }

  for (const SheetDescriptor::Tag& tag : desc.tags) {
    if (sheet.animations.contains(tag.name)) {
      Log::warnf(path.empty() ? nullptr : path.c_str(), "duplicate tag '{}'; keeping the first",
                 tag.name);
      continue;
    }
    sheet.animations[tag.name] =
        sliceRange(desc, image, sheet.scale, tag.name, tag.from, tag.to, tag.direction);
  }
  return sheet;
}

AnimationPtr makePlaceholder(const std::string& name,
                             int w,
                             int h,
                             Rgba8 color,
                             Pivot pivot,
                             float duration) {
  auto anim = std::make_shared<Animation>();
  anim->name = name;
  anim->placeholder = true;

  AnimationFrame frame{};
  frame.right = Image::solid(w, h, color);
  frame.left = frame.right.flippedX();
  frame.pivotRight = pivot;
  frame.pivotLeft = Pivot{static_cast<float>(w) - pivot.x, pivot.y};
  frame.source = IntRect{0, 0, w, h};
  anim->frames.push_back(std::move(frame));
  anim->durations.push_back(duration);
  return anim;
}

}  // namespace AnimationLoader
