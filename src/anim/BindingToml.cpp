#include "anim/BindingToml.h"

#include <algorithm>
#include <cstdint>
#include <string>

#include "util/TomlUtil.h"

namespace {

bool readColor(const toml::array& arr, Rgba8& out) {
  if (arr.size() < 3 || arr.size() > 4)
    return false;
  std::uint8_t c[4] = {0, 0, 0, 255};
  for (std::size_t i = 0; i < arr.size(); ++i) {
    auto v = arr[i].value<int>();
    if (!v)
      return false;
    c[i] = static_cast<std::uint8_t>(std::clamp(*v, 0, 255));
  }
  out = Rgba8{c[0], c[1], c[2], c[3]};
  return true;
}

}  // namespace

namespace BindingToml {

void read(const toml::table& tbl, const char* path, AnimationBinding& out) {
  TomlUtil::warnUnknownKeys(tbl, path, "animations",
                            {"sheet", "scale", "baseline", "required", "common_fallbacks",
                             "mapping", "fallbacks", "placeholder"});

  if (auto v = tbl.get("sheet"))
    out.sheetPath = v->value_or(out.sheetPath);
  if (auto v = tbl.get("scale"))
    out.scale = std::max(1, v->value_or(out.scale));
  if (auto v = tbl.get("baseline"))
    out.baseline = v->value_or(out.baseline);

  if (auto arr = tbl["required"].as_array())
    out.required = TomlUtil::readStringArray(*arr, path, "animations.required");
  if (auto arr = tbl["common_fallbacks"].as_array())
    out.commonFallbacks = TomlUtil::readStringArray(*arr, path, "animations.common_fallbacks");

  if (auto m = tbl["mapping"].as_table()) {
    out.mapping = TomlUtil::readStringPairs(*m, path, "animations.mapping");
  }
  if (auto f = tbl["fallbacks"].as_table()) {
    out.fallbacks = TomlUtil::readStringLists(*f, path, "animations.fallbacks");
  }

  if (auto p = tbl["placeholder"].as_table()) {
    TomlUtil::warnUnknownKeys(*p, path, "animations.placeholder", {"size", "color", "duration"});
    if (auto v = p->get("size"))
      out.placeholder.size = std::max(1, v->value_or(out.placeholder.size));
    if (auto v = p->get("duration"))
      out.placeholder.duration = std::max(0.001F, v->value_or(out.placeholder.duration));
    if (auto arr = (*p)["color"].as_array()) {
      if (!readColor(*arr, out.placeholder.color))
        Log::warnf(path, "animations.placeholder.color must be [r, g, b] or [r, g, b, a]");
    }
  }

  // Every state named anywhere needs a tag; default to the state name itself.
  auto ensureMapped = [&out](const std::string& state) {
    const bool mapped = std::ranges::any_of(
        out.mapping, [&state](const auto& entry) { return entry.first == state; });
    if (!mapped)
      out.mapping.emplace_back(state, state);
  };
  for (const std::string& state : out.required) {
    ensureMapped(state);
  }
  ensureMapped(out.baseline);
}

}  // namespace BindingToml
