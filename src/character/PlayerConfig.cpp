#include "character/PlayerConfig.h"

#include <algorithm>
#include <string>
#include <utility>

#include <toml++/toml.h>

#include "anim/BindingToml.h"
#include "util/TomlUtil.h"

AnimationBinding defaultPlayerAnimations() {
  AnimationBinding b;
  b.entityType = "player";
  b.sheetPath = "assets/player/player.json";
  b.scale = 2;
  b.mapping = {
      {"idle", "Idle"},
      {"walk", "Walk"},
      {"jump", "Jump"},
      {"trans", "trans"},
      {"fall", "Fall"},
      {"dash", "Dash"},
      {"attack1", "Slash 1"},
      {"attack2", "Slash 2"},
      {"spawn", "Appear Tele"},
      {"hit", "Hit"},
      {"death", "death"},
      {"ledge_grab", "Ledge Grab"},
      {"wall_hold", "Wall hold"},
      {"wall_transition", "Wall Transition"},
      {"wall_slide", "Wall Slide"},
      {"wall_slide_stop", "Wall slide Stop"},
      {"roll", "Roll"},
      {"fall_attack", "Fall Attack"},
      {"slam_attack", "Slam"},
  };
  b.required = {"idle", "walk", "jump", "fall", "attack1", "spawn", "hit", "death"};
  b.fallbacks = {
      {"walk", {"idle"}},
      {"jump", {"idle"}},
      {"trans", {"walk", "idle"}},
      {"fall", {"jump", "idle"}},
      {"dash", {"walk", "idle"}},
      {"attack2", {"attack1"}},
      {"roll", {"dash", "walk"}},
      {"fall_attack", {"attack1", "fall"}},
      {"slam_attack", {"attack1"}},
      {"hit", {"idle"}},
      {"death", {"hit", "idle"}},
      {"spawn", {"idle"}},
      {"ledge_grab", {"idle"}},
      {"wall_hold", {"idle"}},
      {"wall_transition", {"wall_hold", "idle"}},
      {"wall_slide", {"wall_transition", "fall", "idle"}},
      {"wall_slide_stop", {"wall_slide", "idle"}},
  };
  b.placeholder.size = 60;
  b.placeholder.color = Rgba8{80, 150, 255, 255};
  b.placeholder.duration = 0.1F;
  return b;
}

namespace {

void readFrameRange(const toml::node* node,
                    const char* path,
                    const char* key,
                    PlayerConfig::FrameRange& out) {
  if (node == nullptr)
    return;
  const auto* arr = node->as_array();
  if ((arr == nullptr) || arr->size() != 2) {
    Log::warnf(path, "attack.{} must be [from, to]", key);
    return;
  }
  auto from = (*arr)[0].value<int>();
  auto to = (*arr)[1].value<int>();
  if (!from || !to || *from < 0 || *to < *from) {
    Log::warnf(path, "attack.{} must be two frame indices with from <= to", key);
    return;
  }
  out.from = *from;
  out.to = *to;
}

float nonNegative(float v) {
  return std::max(0.0F, v);
}

}  // namespace

bool PlayerConfig::loadFromToml(const char* path) {
  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    Log::errorf(path, "{}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root",
                            {"version", "player", "body", "move", "dash", "roll", "attack",
                             "combat", "spawn", "wall", "animations"});

  PlayerConfig next{};

  if (auto v = tbl["version"].value<int>())
    next.version = *v;

  if (auto p = tbl["player"].as_table()) {
    TomlUtil::warnUnknownKeys(*p, path, "player", {"id", "max_health"});
    if (auto v = p->get("id"))
      next.id = v->value_or(next.id);
    if (auto v = p->get("max_health"))
      next.maxHealth = std::max(1, v->value_or(next.maxHealth));
  }

  if (auto b = tbl["body"].as_table()) {
    TomlUtil::warnUnknownKeys(*b, path, "body", {"w", "h"});
    if (auto v = b->get("w"))
      next.body.w = std::max(1.0F, v->value_or(next.body.w));
    if (auto v = b->get("h"))
      next.body.h = std::max(1.0F, v->value_or(next.body.h));
  }

  if (auto m = tbl["move"].as_table()) {
    TomlUtil::warnUnknownKeys(*m, path, "move",
                              {"speed", "jump_speed", "gravity", "max_fall_speed", "max_jumps"});
    if (auto v = m->get("speed"))
      next.move.speed = nonNegative(v->value_or(next.move.speed));
    if (auto v = m->get("jump_speed"))
      next.move.jumpSpeed = nonNegative(v->value_or(next.move.jumpSpeed));
    if (auto v = m->get("gravity"))
      next.move.gravity = nonNegative(v->value_or(next.move.gravity));
    if (auto v = m->get("max_fall_speed"))
      next.move.maxFallSpeed = nonNegative(v->value_or(next.move.maxFallSpeed));
    if (auto v = m->get("max_jumps"))
      next.move.maxJumps = std::max(0, v->value_or(next.move.maxJumps));
  }

  if (auto d = tbl["dash"].as_table()) {
    TomlUtil::warnUnknownKeys(*d, path, "dash", {"duration", "speed", "cooldown"});
    if (auto v = d->get("duration"))
      next.dash.duration = nonNegative(v->value_or(next.dash.duration));
    if (auto v = d->get("speed"))
      next.dash.speed = nonNegative(v->value_or(next.dash.speed));
    if (auto v = d->get("cooldown"))
      next.dash.cooldown = nonNegative(v->value_or(next.dash.cooldown));
  }

  if (auto r = tbl["roll"].as_table()) {
    TomlUtil::warnUnknownKeys(*r, path, "roll", {"duration", "speed"});
    if (auto v = r->get("duration"))
      next.roll.duration = nonNegative(v->value_or(next.roll.duration));
    if (auto v = r->get("speed"))
      next.roll.speed = nonNegative(v->value_or(next.roll.speed));
  }

  if (auto a = tbl["attack"].as_table()) {
    TomlUtil::warnUnknownKeys(*a, path, "attack",
                              {"attack1_duration", "attack2_duration", "combo_window", "cooldown",
                               "attack1_move_scale", "attack2_move_scale", "attack1_active",
                               "attack2_active", "hitbox_w", "hitbox_h", "offset_x", "offset_y",
                               "damage"});
    Attack& at = next.attack;
    if (auto v = a->get("attack1_duration"))
      at.attack1Duration = nonNegative(v->value_or(at.attack1Duration));
    if (auto v = a->get("attack2_duration"))
      at.attack2Duration = nonNegative(v->value_or(at.attack2Duration));
    if (auto v = a->get("combo_window"))
      at.comboWindow = nonNegative(v->value_or(at.comboWindow));
    if (auto v = a->get("cooldown"))
      at.cooldown = nonNegative(v->value_or(at.cooldown));
    if (auto v = a->get("attack1_move_scale"))
      at.attack1MoveScale = std::clamp(v->value_or(at.attack1MoveScale), 0.0F, 1.0F);
    if (auto v = a->get("attack2_move_scale"))
      at.attack2MoveScale = std::clamp(v->value_or(at.attack2MoveScale), 0.0F, 1.0F);
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

  if (auto c = tbl["combat"].as_table()) {
    TomlUtil::warnUnknownKeys(*c, path, "combat",
                              {"invulnerability", "hit_duration", "death_duration",
                               "hit_speed_scale"});
    if (auto v = c->get("invulnerability"))
      next.combat.invulnerability = nonNegative(v->value_or(next.combat.invulnerability));
    if (auto v = c->get("hit_duration"))
      next.combat.hitDuration = nonNegative(v->value_or(next.combat.hitDuration));
    if (auto v = c->get("death_duration"))
      next.combat.deathDuration = nonNegative(v->value_or(next.combat.deathDuration));
    if (auto v = c->get("hit_speed_scale"))
      next.combat.hitSpeedScale = std::clamp(v->value_or(next.combat.hitSpeedScale), 0.0F, 1.0F);
  }

  if (auto s = tbl["spawn"].as_table()) {
    TomlUtil::warnUnknownKeys(*s, path, "spawn", {"duration"});
    if (auto v = s->get("duration"))
      next.spawn.duration = nonNegative(v->value_or(next.spawn.duration));
  }

  if (auto w = tbl["wall"].as_table()) {
    TomlUtil::warnUnknownKeys(*w, path, "wall",
                              {"enabled", "hold_grace", "slide_speed", "jump_speed_x",
                               "jump_lockout", "ledge_reach"});
    if (auto v = w->get("enabled"))
      next.wall.enabled = v->value_or(next.wall.enabled);
    if (auto v = w->get("hold_grace"))
      next.wall.holdGrace = nonNegative(v->value_or(next.wall.holdGrace));
    if (auto v = w->get("slide_speed"))
      next.wall.slideSpeed = nonNegative(v->value_or(next.wall.slideSpeed));
    if (auto v = w->get("jump_speed_x"))
      next.wall.jumpSpeedX = nonNegative(v->value_or(next.wall.jumpSpeedX));
    if (auto v = w->get("jump_lockout"))
      next.wall.jumpLockout = nonNegative(v->value_or(next.wall.jumpLockout));
    if (auto v = w->get("ledge_reach"))
      next.wall.ledgeReach = nonNegative(v->value_or(next.wall.ledgeReach));
  }

  if (auto a = tbl["animations"].as_table()) {
    BindingToml::read(*a, path, next.animations);
  }
  next.animations.entityType = next.id;

  *this = std::move(next);
  return true;
}
