#pragma once

#include <string>

#include "anim/Animation.h"
#include "anim/Image.h"
#include "anim/SheetDescriptor.h"

namespace AnimationLoader {

// Loads descriptor + image and slices every tag. On failure `out` is left untouched and the
// status says why; callers substitute a placeholder.
SheetStatus load(const std::string& jsonPath, int scale, AnimationSheet& out);

// Slices an already parsed descriptor against its image. A sheet without tags yields one
// "default" animation spanning every frame.
AnimationSheet build(const SheetDescriptor& desc,
                     const Image& image,
                     int scale,
                     const std::string& path = {});

// Single static coloured rectangle. Size and pivot are already in scaled pixels.
AnimationPtr makePlaceholder(const std::string& name,
                             int w,
                             int h,
                             Rgba8 color,
                             Pivot pivot,
                             float duration);

}  // namespace AnimationLoader
