#include "enemy/EnemyConfig.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include <toml++/toml.h>

#include "anim/BindingToml.h"
#include "util/TomlUtil.h"

AnimationBinding defaultAssassinAnimations() {
  AnimationBinding b;
  b.entityType = "assassin";
  b.sheetPath = "assets/enemies/assassin/Assassin.json";
  b.scale = 2;
  b.mapping = {
      {"idle", "idle"},         {"run", "run"},           {"jump", "jump"},
      {"fall", "fall"},         {"attack1", "attack 1"},  {"attack2", "attack 2"},
      {"hit", "hit"},           {"death", "death"},       {"spawn", "spawn"},
  };
  b.required = {"idle", "run", "attack1", "hit", "death"};
  b.fallbacks = {
      {"run", {"idle"}},  {"jump", {"idle"}},        {"fall", {"jump", "idle"}},
      {"attack2", {"attack1"}}, {"hit", {"idle"}},   {"death", {"hit", "idle"}},
      {"spawn", {"idle"}},
  };
  b.placeholder.size = 40;
  b.placeholder.color = Rgba8{255, 80, 80, 255};
  b.placeholder.duration = 0.15F;
  return b;
}

namespace {

float clampNonNegative(float v) {
  return std::max(0.0F, v);
}

void readFrameRange(const toml::node* node,
                    const char* path,
                    const char* key,
                    EnemyConfig::FrameRange& out) {
  if (node == nullptr)
    return;
  const auto* arr = node->as_array();
  auto from = (arr != nullptr && arr->size() == 2) ? (*arr)[0].value<int>() : std::nullopt;
  auto to = (arr != nullptr && arr->size() == 2) ? (*arr)[1].value<int>() : std::nullopt;
  if (!from || !to || *from < 0 || *to < *from) {
    Log::warnf(path, "attack.{} must be [from, to] with 0 <= from <= to", key);
    return;
  }
  out.from = *from;
  out.to = *to;
}

}  // namespace

bool EnemyConfig::loadFromToml(const char* path) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    Log::errorf(path, "{}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "enemy", "body", "move", "ai", "combat", "attack",
                             "animations"});

  EnemyConfig next{};

  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto e = tbl["enemy"].as_table()) {
    TomlUtil::warnUnknownKeys(*e, path, "enemy", {"id", "display"});
    if (auto v = e->get("id"))
      next.id = v->value_or(next.id);
    if (auto v = e->get("display"))
      next.displayName = v->value_or(next.displayName);
  }
  if (next.displayName.empty())
    next.displayName = next.id;

  if (auto b = tbl["body"].as_table()) {
    TomlUtil::warnUnknownKeys(*b, path, "body", {"w", "h"});
    if (auto v = b->get("w"))
      next.body.w = std::max(1.0F, v->value_or(next.body.w));
    if (auto v = b->get("h"))
      next.body.h = std::max(1.0F, v->value_or(next.body.h));
  }

  if (auto m = tbl["move"].as_table()) {
    TomlUtil::warnUnknownKeys(*m, path, "move",
                              {"speed", "gravity", "max_fall_speed", "turn_on_wall",
                               "turn_on_edge", "turn_pause"});
    if (auto v = m->get("speed"))
      next.move.speed = clampNonNegative(v->value_or(next.move.speed));
    if (auto v = m->get("gravity"))
      next.move.gravity = clampNonNegative(v->value_or(next.move.gravity));
    if (auto v = m->get("max_fall_speed"))
      next.move.maxFallSpeed = clampNonNegative(v->value_or(next.move.maxFallSpeed));
    if (auto v = m->get("turn_on_wall"))
      next.move.turnOnWall = v->value_or(next.move.turnOnWall);
    if (auto v = m->get("turn_on_edge"))
      next.move.turnOnEdge = v->value_or(next.move.turnOnEdge);
    if (auto v = m->get("turn_pause"))
      next.move.turnPause = clampNonNegative(v->value_or(next.move.turnPause));
  }

  if (auto a = tbl["ai"].as_table()) {
    TomlUtil::warnUnknownKeys(*a, path, "ai",
                              {"aggro_range", "aggro_height", "attack_range", "chase_speed_scale",
                               "chain_attack2"});
    if (auto v = a->get("aggro_range"))
      next.ai.aggroRange = clampNonNegative(v->value_or(next.ai.aggroRange));
    if (auto v = a->get("aggro_height"))
      next.ai.aggroHeight = clampNonNegative(v->value_or(next.ai.aggroHeight));
    if (auto v = a->get("attack_range"))
      next.ai.attackRange = clampNonNegative(v->value_or(next.ai.attackRange));
    if (auto v = a->get("chase_speed_scale"))
      next.ai.chaseSpeedScale = clampNonNegative(v->value_or(next.ai.chaseSpeedScale));
    if (auto v = a->get("chain_attack2"))
      next.ai.chainAttack2 = v->value_or(next.ai.chainAttack2);
  }

  if (auto c = tbl["combat"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, path, "combat",
                              {"health", "iframes", "hit_duration", "death_duration",
                               "spawn_duration"});
    if (auto v = c->get("health"))
      next.combat.health = std::max(1, v->value_or(next.combat.health));
    if (auto v = c->get("iframes"))
      next.combat.iframes = clampNonNegative(v->value_or(next.combat.iframes));
    if (auto v = c->get("hit_duration"))
      next.combat.hitDuration = clampNonNegative(v->value_or(next.combat.hitDuration));
    if (auto v = c->get("death_duration"))
      next.combat.deathDuration = clampNonNegative(v->value_or(next.combat.deathDuration));
    if (auto v = c->get("spawn_duration"))
      next.combat.spawnDuration = clampNonNegative(v->value_or(next.combat.spawnDuration));
  }

  if (auto a = tbl["attack"].as_table()) {
    TomlUtil::warnUnknownKeys(*a, path, "attack",
                              {"attack1_duration", "attack2_duration", "cooldown",
                               "attack1_active", "attack2_active", "hitbox_w", "hitbox_h",
                               "offset_x", "offset_y", "damage"});
    Attack& at = next.attack;
    if (auto v = a->get("attack1_duration"))
      at.attack1Duration = clampNonNegative(v->value_or(at.attack1Duration));
    if (auto v = a->get("attack2_duration"))
      at.attack2Duration = clampNonNegative(v->value_or(at.attack2Duration));
    if (auto v = a->get("cooldown"))
      at.cooldown = clampNonNegative(v->value_or(at.cooldown));
    readFrameRange(a->get("attack1_active"), path, "attack1_active", at.active1);
    readFrameRange(a->get("attack2_active"), path, "attack2_active", at.active2);
    if (auto v = a->get("hitbox_w"))
      at.hitboxW = std::max(1.0F, v->value_or(at.hitboxW));
    if (auto v = a->get("hitbox_h"))
      at.hitboxH = std::max(1.0F, v->value_or(at.hitboxH));
    if (auto v = a->get("offset_x"))
      at.offsetX = v->value_or(at.offsetX);
    if (auto v = a->get("offset_y"))
      at.offsetY = v->value_or(at.offsetY);
    if (auto v = a->get("damage"))
      at.damage = std::max(0, v->value_or(at.damage));
  }

  if (auto a = tbl["animations"].as_table()) {
    BindingToml::read(*a, path, next.animations);
  }
  next.animations.entityType = next.id;

  *this = std::move(next);
  return true;
}
