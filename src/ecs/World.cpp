#include "ecs/World.h"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

#include "anim/AssetRegistry.h"
#include "anim/EntityAnimations.h"
#include "character/PlayerController.h"
#include "ecs/Systems.h"
#include "enemy/EnemyController.h"
#include "util/Log.h"
#include "world/TileMap.h"

namespace {

InputState heldOnly(const InputState& in) {
  InputState out = in;
  out.downPressed = false;
  out.jumpPressed = false;
  out.jumpReleased = false;
  out.attackPressed = false;
  out.dashPressed = false;
  out.rollPressed = false;
  return out;
}

int facingFromProperties(const MapObject& obj) {
  auto it = obj.properties.find("facing");
  if (it != obj.properties.end() && it->second == "right")
    return 1;
  return -1;
}

std::string lowered(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Editor names such as "Collectible_01" carry no id; they fall back to bandage.
std::string collectibleIdFor(const MapObject& obj) {
  if (auto it = obj.properties.find("collectible_type"); it != obj.properties.end())
    return it->second;
  const std::string name = lowered(obj.name);
  const auto has = [&name](std::string_view word) {
    return name.find(word) != std::string::npos;
  };
  if (has("bandage"))
    return "bandage";
  if (has("key"))
    return "key";
  if (has("ammo"))
    return "ammo";
  if (has("health"))
    return "bandage";
  if (has("potion") || has("bottle"))
    return "bottle";
  return "bandage";
}

}  // namespace

World::World() = default;
World::~World() = default;

EntityId World::create() {
  return registry.create();
}

void World::destroy(EntityId id) {
  registry.destroy(id);
}

std::shared_ptr<const EntityAnimations> World::loadAnimations(const AnimationBinding& binding) {
  auto anims = std::make_shared<EntityAnimations>();
  if (!anims->load(binding, assets_->sheet(binding.sheetPath, binding.scale))) {
    error_ = anims->error();
    return nullptr;
  }
  return anims;
}

bool World::load(const TileMap& map, AssetRegistry& assets, const Prototypes& protos) {
  registry.clear();
  player = kInvalidEntity;
  hurtEvents = 0;
  enemyKills = 0;
  respawns = 0;
  pickups = 0;
  warnedMissing_.clear();
  error_.clear();
  playerCtl_.reset();
  enemyCtl_.clear();
  collectibleCfg_.clear();
  collectibleAnims_.clear();
  map_ = &map;
  assets_ = &assets;

  auto playerAnims = loadAnimations(protos.player.animations);
  if (!playerAnims)
    return false;

  for (const auto& [id, cfg] : protos.enemies) {
    auto anims = loadAnimations(cfg.animations);
    if (!anims) {
      enemyCtl_.clear();
      return false;
    }
    enemyCtl_[id] = std::make_shared<const EnemyController>(cfg, std::move(anims));
  }

  for (const auto& [id, cfg] : protos.collectibles) {
    auto anims = loadAnimations(cfg.animations);
    if (!anims) {
      enemyCtl_.clear();
      collectibleCfg_.clear();
      collectibleAnims_.clear();
      return false;
    }
    collectibleCfg_[id] = cfg;
    collectibleAnims_[id] = std::move(anims);
  }
  playerCtl_ = std::make_unique<PlayerController>(protos.player, playerAnims);

  const PlayerConfig& pc = playerCtl_->config();
  player = create();
  registry.emplace<PlayerTag>(player);
  registry.emplace<Transform>(player);
  registry.emplace<Velocity>(player);
  registry.emplace<AABB>(player, pc.body.w, pc.body.h);
  registry.emplace<PlayerRuntime>(player);
  registry.emplace<AnimPlayback>(player);
  registry.emplace<Animated>(player, playerCtl_->animations());
  registry.emplace<DebugName>(player, pc.id);
  respawnPlayer();
  respawns = 0;

  for (const MapObject& obj : map.objects()) {
    float x = 0.0F;
    float y = 0.0F;
    map.objectFeet(obj, x, y);
    if (obj.type == "enemy") {
      (void)spawnEnemy(enemyIdFor(obj), x, y, facingFromProperties(obj));
    } else if (obj.type == "collectible") {
      (void)spawnCollectible(collectibleIdFor(obj), x, y);
    }
  }
  return true;
}

std::string World::enemyIdFor(const MapObject& obj) const {
  if (auto it = obj.properties.find("enemy_type"); it != obj.properties.end())
    return it->second;
  if (enemyCtl_.count(obj.name) != 0 || enemyCtl_.empty())
    return obj.name;
  // Unnamed spawns ("Enemy_01") use the assassin, or the first configured id.
  if (enemyCtl_.count("assassin") != 0)
    return "assassin";
  std::string first = enemyCtl_.begin()->first;
  for (const auto& entry : enemyCtl_)
    first = std::min(first, entry.first);
  return first;
}

const EnemyController* World::enemyController(const std::string& id) const {
  auto it = enemyCtl_.find(id);
  return (it != enemyCtl_.end()) ? it->second.get() : nullptr;
}

EntityId World::spawnEnemy(const std::string& id, float x, float y, int facingX) {
  auto it = enemyCtl_.find(id);
  if (it == enemyCtl_.end()) {
    Log::warnf(map_->path().empty() ? nullptr : map_->path().c_str(),
               "enemy object '{}' has no enemy config; skipped", id);
    return kInvalidEntity;
  }
  const std::shared_ptr<const EnemyController>& ctl = it->second;
  const EnemyConfig& cfg = ctl->config();

  const EntityId e = create();
  registry.emplace<EnemyTag>(e);
  auto& t = registry.emplace<Transform>(e);
  auto& v = registry.emplace<Velocity>(e);
  registry.emplace<AABB>(e, cfg.body.w, cfg.body.h);
  auto& rt = registry.emplace<EnemyRuntime>(e);
  registry.emplace<EnemyBrain>(e, ctl);
  registry.emplace<AnimPlayback>(e);
  registry.emplace<Animated>(e, ctl->animations());
  registry.emplace<DebugName>(e, cfg.displayName);
  ctl->spawn(rt, t, v, x, y, facingX);
  return e;
}

EntityId World::spawnCollectible(const std::string& id, float x, float y) {
  auto it = collectibleCfg_.find(id);
  if (it == collectibleCfg_.end()) {
    Log::warnf(map_->path().empty() ? nullptr : map_->path().c_str(),
               "collectible object '{}' has no collectible config; skipped", id);
    return kInvalidEntity;
  }
  const CollectibleConfig& cfg = it->second;

  CollectibleState state{};
  state.healthRestore = cfg.value.health;
  state.anchor = Vec2{x, y - cfg.hover.height};
  state.amplitude = cfg.hover.amplitude;
  state.bobSpeed = cfg.hover.bobSpeed;

  const EntityId e = create();
  registry.emplace<CollectibleTag>(e);
  registry.emplace<Transform>(e, state.anchor);
  registry.emplace<AABB>(e, cfg.collision.w, cfg.collision.h);
  registry.emplace<CollectibleState>(e, state);
  auto& anim = registry.emplace<AnimPlayback>(e);
  anim.state = "idle";
  registry.emplace<Animated>(e, collectibleAnims_.at(id));
  registry.emplace<DebugName>(e, cfg.displayName);
  return e;
}

Vec2 World::playerSpawnPoint() const {
  if (const MapObject* spawn = map_->findSpawn("Player")) {
    Vec2 p{};
    map_->objectFeet(*spawn, p.x, p.y);
    return p;
  }
  const Rect bounds = map_->worldBounds();
  return Vec2{bounds.x + bounds.w * 0.5F, 100.0F};
}

void World::respawnPlayer() {
  if (!entityAlive(registry, player))
    return;
  auto& rt = registry.get<PlayerRuntime>(player);
  auto& t = registry.get<Transform>(player);
  auto& v = registry.get<Velocity>(player);
  const Vec2 p = playerSpawnPoint();
  playerCtl_->spawn(rt, t, v, p.x, p.y);
  ++respawns;
}

bool World::noteMissingAnimation(const std::string& entityType, const std::string& state) {
  return warnedMissing_.emplace(entityType, state).second;
}

void World::update(const InputState& in, TimeStep ts) {
  if (!loaded())
    return;
  float remaining = std::min(ts.dt, kMaxFrameDt);
  bool first = true;
  while (remaining > 0.0F) {
    const float h = std::min(remaining, kMaxSubstep);
    step(first ? in : heldOnly(in), h);
    first = false;
    remaining -= h;
  }
}

void World::step(const InputState& in, float dt) {
  Systems::player(*this, in, dt);
  Systems::enemies(*this, dt);
  Systems::combat(*this);
  Systems::hazards(*this);
  Systems::collectibles(*this, dt);
  Systems::animate(*this, dt);
}
