#include "collectible/CollectibleConfig.h"

#include <algorithm>
#include <utility>

#include <toml++/toml.h>

#include "anim/BindingToml.h"
#include "util/TomlUtil.h"

AnimationBinding defaultCollectibleAnimations(const std::string& id) {
  AnimationBinding b;
  b.entityType = id;
  b.sheetPath = "assets/collectibles/collects.json";
  b.scale = 2;
  b.mapping = {{"idle", id}};
  b.required = {"idle"};
  b.commonFallbacks.clear();
  b.placeholder.size = 16;
  b.placeholder.color = Rgba8{255, 100, 100, 255};
  b.placeholder.duration = 0.1F;
  return b;
}

namespace {

float clampNonNegative(float v) {
  return std::max(0.0F, v);
}

}  // namespace

bool CollectibleConfig::loadFromToml(const char* path) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    Log::errorf(path, "{}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "collectible", "collision", "value", "float",
                             "animations"});

  CollectibleConfig next{};

  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto c = tbl["collectible"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, path, "collectible", {"id", "display"});
    if (auto v = c->get("id"))
      next.id = v->value_or(next.id);
    if (auto v = c->get("display"))
      next.displayName = v->value_or(next.displayName);
  }
  if (next.displayName.empty())
    next.displayName = next.id;
  next.animations = defaultCollectibleAnimations(next.id);

  if (auto c = tbl["collision"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, path, "collision", {"w", "h"});
    if (auto v = c->get("w"))
      next.collision.w = std::max(1.0F, v->value_or(next.collision.w));
    if (auto v = c->get("h"))
      next.collision.h = std::max(1.0F, v->value_or(next.collision.h));
  }

  if (auto val = tbl["value"].as_table()) {
    TomlUtil::warnUnknownKeys(*val, path, "value", {"health"});
    if (auto v = val->get("health"))
      next.value.health = std::max(0, v->value_or(next.value.health));
  }

  if (auto f = tbl["float"].as_table()) {
    TomlUtil::warnUnknownKeys(*f, path, "float", {"height", "amplitude", "bob_speed"});
    if (auto v = f->get("height"))
      next.hover.height = v->value_or(next.hover.height);
    if (auto v = f->get("amplitude"))
      next.hover.amplitude = clampNonNegative(v->value_or(next.hover.amplitude));
    if (auto v = f->get("bob_speed"))
      next.hover.bobSpeed = clampNonNegative(v->value_or(next.hover.bobSpeed));
  }

  if (auto a = tbl["animations"].as_table()) {
    BindingToml::read(*a, path, next.animations);
  }
  next.animations.entityType = next.id;

  *this = std::move(next);
  return true;
}
