#pragma once

#include <toml++/toml.h>

#include "anim/EntityAnimations.h"

namespace BindingToml {

// Reads an [animations] table into `out`, keeping whatever `out` already holds for keys the
// table leaves out. Unknown keys and wrongly typed values are reported and ignored.
void read(const toml::table& tbl, const char* path, AnimationBinding& out);

}  // namespace BindingToml
