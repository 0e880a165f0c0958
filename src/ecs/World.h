#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <entt/entt.hpp>

#include "character/PlayerConfig.h"
#include "collectible/CollectibleConfig.h"
#include "core/Time.h"
#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"
#include "enemy/EnemyConfig.h"

class AssetRegistry;
class EnemyController;
class PlayerController;
class TileMap;
struct MapObject;

// Pixels outside the world before the player is brought back.
inline constexpr float kOutOfWorldMargin = 100.0F;

struct Prototypes {
  PlayerConfig player;
  std::unordered_map<std::string, EnemyConfig> enemies;            // by id
  std::unordered_map<std::string, CollectibleConfig> collectibles;  // by id
};

class World {
 public:
  World();
  ~World();
  World(const World&) = delete;
  World& operator=(const World&) = delete;

  EntityId create();
  void destroy(EntityId);

  // Spawns the player, one enemy per "enemy" object and one pickup per "collectible"
  // object. False on a configuration error; see error().
  bool load(const TileMap& map, AssetRegistry& assets, const Prototypes& protos);

  // Caps dt and runs fixed sub-steps. Press/release edges only reach the first sub-step.
  void update(const InputState& in, TimeStep ts);
  void step(const InputState& in, float dt);

  void respawnPlayer();
  [[nodiscard]] Vec2 playerSpawnPoint() const;

  EntityId spawnEnemy(const std::string& id, float x, float y, int facingX);
  EntityId spawnCollectible(const std::string& id, float x, float y);

  [[nodiscard]] const TileMap& map() const { return *map_; }
  [[nodiscard]] bool loaded() const { return map_ != nullptr && playerCtl_ != nullptr; }
  [[nodiscard]] const PlayerController* playerController() const { return playerCtl_.get(); }
  [[nodiscard]] const EnemyController* enemyController(const std::string& id) const;
  [[nodiscard]] const std::string& error() const { return error_; }

  // True the first time (entity type, state) is reported missing.
  bool noteMissingAnimation(const std::string& entityType, const std::string& state);

  entt::registry registry;

  // debug/test-friendly counters
  int hurtEvents = 0;
  int enemyKills = 0;
  int respawns = 0;
  int pickups = 0;

  // external handle: "currently controlled player"
  EntityId player = kInvalidEntity;

 private:
  std::shared_ptr<const EntityAnimations> loadAnimations(const AnimationBinding& binding);
  [[nodiscard]] std::string enemyIdFor(const MapObject& obj) const;

  const TileMap* map_ = nullptr;
  AssetRegistry* assets_ = nullptr;
  std::unique_ptr<PlayerController> playerCtl_;
  std::unordered_map<std::string, std::shared_ptr<const EnemyController>> enemyCtl_;
  std::unordered_map<std::string, CollectibleConfig> collectibleCfg_;
  std::unordered_map<std::string, std::shared_ptr<const EntityAnimations>> collectibleAnims_;
  std::set<std::pair<std::string, std::string>> warnedMissing_;
  std::string error_;
};
