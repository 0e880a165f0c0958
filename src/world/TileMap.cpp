#include "world/TileMap.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "util/Log.h"
#include "util/Paths.h"

using Json = nlohmann::json;

namespace {

constexpr int kTestCols = 40;
constexpr int kTestRows = 15;
constexpr int kTestTile = 16;
constexpr int kTestSolid = 0;
constexpr int kTestPlatform = 1;
constexpr int kTestDamage = 2;

// Larger maps or tile ids are treated as malformed content.
constexpr int kMaxMapCells = 4096;  // per axis
constexpr int kMaxTileSize = 1024;
constexpr int kMaxTileId = 65535;

std::string propertyString(const Json& v) {
  if (v.is_string())
    return v.get<std::string>();
  return v.dump();
}

}  // namespace

const char* toString(TileCollision c) {
  switch (c) {
    case TileCollision::None:
      return "none";
    case TileCollision::Solid:
      return "solid";
    case TileCollision::Platform:
      return "platform";
    case TileCollision::Damage:
      return "damage";
    case TileCollision::Water:
      return "water";
    case TileCollision::Ice:
      return "ice";
    case TileCollision::Trigger:
      return "trigger";
  }
  return "none";
}

std::optional<TileCollision> parseTileCollision(std::string_view s) {
  if (s == "none")
    return TileCollision::None;
  if (s == "solid")
    return TileCollision::Solid;
  if (s == "platform")
    return TileCollision::Platform;
  if (s == "damage")
    return TileCollision::Damage;
  if (s == "water")
    return TileCollision::Water;
  if (s == "ice")
    return TileCollision::Ice;
  if (s == "trigger")
    return TileCollision::Trigger;
  return std::nullopt;
}

void TileMap::reset() {
  cols_ = 0;
  rows_ = 0;
  tileSize_ = 16;
  margin_ = 0;
  spacing_ = 0;
  scale_ = 1;
  path_.clear();
  tilesetPath_.clear();
  layers_.clear();
  tileClasses_.clear();
  cellClasses_.clear();
  objects_.clear();
}

void TileMap::loadTestMap(int scale) {
  reset();
  path_ = "<test map>";
  cols_ = kTestCols;
  rows_ = kTestRows;
  tileSize_ = kTestTile;
  scale_ = std::max(1, scale);

  tileClasses_ = {TileCollision::Solid, TileCollision::Platform, TileCollision::Damage};

  TileLayer ground{"ground", std::vector<int>(static_cast<std::size_t>(cols_ * rows_), kEmpty)};
  auto put = [&](int col, int row, int id) {
    ground.tiles[static_cast<std::size_t>(row * cols_ + col)] = id;
  };

  // floor with a spike pit
  for (int c = 0; c < cols_; ++c) {
    const bool pit = (c >= 18 && c <= 20);
    if (!pit)
      put(c, 13, kTestSolid);
    put(c, 14, pit ? kTestDamage : kTestSolid);
  }
  // one-way platform
  for (int c = 6; c <= 10; ++c) {
    put(c, 9, kTestPlatform);
  }
  // wall with a grabbable top
  for (int r = 8; r <= 12; ++r) {
    put(30, r, kTestSolid);
  }
  layers_.push_back(std::move(ground));

  objects_.push_back(MapObject{"Player", "spawn", 3, 12, {}});
  objects_.push_back(MapObject{"assassin", "enemy", 25, 12, {}});
  objects_.push_back(MapObject{"bandage", "collectible", 8, 8, {}});

  rebuildCollisionGrid();
}

bool TileMap::loadFromJson(const char* path, int scale) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    Log::warnf(path, "map file not found");
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse(ss.str(), path, scale);
}

// NOLINTNEXTLINE
bool TileMap::parse(std::string_view text, const char* path, int scale) {
  TileMap next{};
  next.path_ = (path != nullptr) ? path : "";
  next.scale_ = std::max(1, scale);

  try {
    const Json root = Json::parse(text);

    next.tileSize_ = root.at("tile_size").get<int>();
    next.cols_ = root.at("map_cols").get<int>();
    next.rows_ = root.at("map_rows").get<int>();
    next.margin_ = root.value("margin", 0);
    next.spacing_ = root.value("spacing", 0);
    if (next.tileSize_ <= 0 || next.cols_ <= 0 || next.rows_ <= 0) {
      Log::warnf(path, "tile_size, map_cols and map_rows must be positive");
      return false;
    }
    if (next.tileSize_ > kMaxTileSize || next.cols_ > kMaxMapCells || next.rows_ > kMaxMapCells) {
      Log::warnf(path, "map is too large ({}x{} tiles of {} px; limits {}x{} tiles of {} px)",
                 next.cols_, next.rows_, next.tileSize_, kMaxMapCells, kMaxMapCells,
                 kMaxTileSize);
      return false;
    }

    const std::string tileset = root.value("tileset", std::string{});
    if (!tileset.empty() && path != nullptr) {
      next.tilesetPath_ = Paths::siblingPath(path, tileset);
    } else {
      next.tilesetPath_ = tileset;
    }

    if (auto it = root.find("tile_properties"); it != root.end() && it->is_object()) {
      for (const auto& [key, props] : it->items()) {
        int id = -1;
        try {
          id = std::stoi(key);
        } catch (const std::exception&) {
          Log::warnf(path, "tile_properties key '{}' is not a tile id", key);
          continue;
        }
        if (id < 0)
          continue;
        if (id > kMaxTileId) {
          Log::warnf(path, "tile_properties key '{}' is above the largest tile id {}", key,
                     kMaxTileId);
          continue;
        }
        const std::string type = props.value("collision_type", std::string{"none"});
        const auto cls = parseTileCollision(type);
        if (!cls) {
          Log::warnf(path, "tile {} has unknown collision_type '{}'", id, type);
          continue;
        }
        if (static_cast<std::size_t>(id) >= next.tileClasses_.size()) {
          next.tileClasses_.resize(static_cast<std::size_t>(id) + 1, TileCollision::None);
        }
        next.tileClasses_[static_cast<std::size_t>(id)] = *cls;
      }
    }

    const std::size_t cellCount =
        static_cast<std::size_t>(next.cols_) * static_cast<std::size_t>(next.rows_);
    if (auto it = root.find("layers"); it != root.end() && it->is_array()) {
      for (const auto& layerJson : *it) {
        TileLayer layer{};
        layer.name = layerJson.value("name", std::string{});
        layer.tiles.assign(cellCount, kEmpty);
        if (auto tilesIt = layerJson.find("tiles"); tilesIt != layerJson.end()) {
          for (const auto& t : *tilesIt) {
            const int x = t.at("x").get<int>();
            const int y = t.at("y").get<int>();
            const int id = t.at("t").get<int>();
            if (!next.inBounds(x, y)) {
              Log::warnf(path, "layer '{}': tile at ({}, {}) is outside the map", layer.name, x,
                         y);
              continue;
            }
            if (id > kMaxTileId) {
              Log::warnf(path, "layer '{}': tile id {} is above the largest tile id {}",
                         layer.name, id, kMaxTileId);
              continue;
            }
            layer.tiles[static_cast<std::size_t>(y * next.cols_ + x)] = id;
          }
        }
        next.layers_.push_back(std::move(layer));
      }
    }

    if (auto it = root.find("objects"); it != root.end() && it->is_array()) {
      for (const auto& o : *it) {
        MapObject obj{};
        obj.name = o.value("name", std::string{});
        obj.type = o.value("type", std::string{});
        obj.x = o.value("x", 0);
        obj.y = o.value("y", 0);
        if (auto propsIt = o.find("custom_properties"); propsIt != o.end() && propsIt->is_object()) {
          for (const auto& [key, value] : propsIt->items()) {
            obj.properties[key] = propertyString(value);
          }
        }
        next.objects_.push_back(std::move(obj));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    Log::warnf(path, "malformed map: {}", e.what());
    return false;
  }

  next.rebuildCollisionGrid();
  *this = std::move(next);
  return true;
}

void TileMap::rebuildCollisionGrid() {
  cellClasses_.assign(static_cast<std::size_t>(cols_ * rows_), TileCollision::None);
  for (std::size_t i = 0; i < cellClasses_.size(); ++i) {
    // Topmost layer first; decoration without a class does not hide what lies below.
    for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
      const TileCollision c = collisionOfTile(it->tiles[i]);
      if (c != TileCollision::None) {
        cellClasses_[i] = c;
        break;
      }
    }
  }
}

int TileMap::tileAt(std::size_t layer, int col, int row) const {
  if (layer >= layers_.size() || !inBounds(col, row))
    return kEmpty;
  return layers_[layer].tiles[static_cast<std::size_t>(row * cols_ + col)];
}

bool TileMap::inBounds(int col, int row) const {
  return col >= 0 && row >= 0 && col < cols_ && row < rows_;
}

int TileMap::cellX(float worldX) const {
  return static_cast<int>(std::floor(worldX / tileSize()));
}

int TileMap::cellY(float worldY) const {
  return static_cast<int>(std::floor(worldY / tileSize()));
}

TileCollision TileMap::collisionOfTile(int tileId) const {
  if (tileId < 0 || static_cast<std::size_t>(tileId) >= tileClasses_.size())
    return TileCollision::None;
  return tileClasses_[static_cast<std::size_t>(tileId)];
}

TileCollision TileMap::collisionAtCell(int col, int row) const {
  if (!inBounds(col, row))
    return TileCollision::None;
  return cellClasses_[static_cast<std::size_t>(row * cols_ + col)];
}

TileCollision TileMap::collisionAt(float worldX, float worldY) const {
  return collisionAtCell(cellX(worldX), cellY(worldY));
}

bool TileMap::isSolidAt(float worldX, float worldY) const {
  return collisionAt(worldX, worldY) == TileCollision::Solid;
}

bool TileMap::isPlatformAt(float worldX, float worldY) const {
  return collisionAt(worldX, worldY) == TileCollision::Platform;
}

bool TileMap::isDamageAt(float worldX, float worldY) const {
  return collisionAt(worldX, worldY) == TileCollision::Damage;
}

Rect TileMap::worldBounds() const {
  return Rect{0.0F, 0.0F, static_cast<float>(cols_) * tileSize(),
              static_cast<float>(rows_) * tileSize()};
}

std::vector<const MapObject*> TileMap::objectsByType(std::string_view type) const {
  std::vector<const MapObject*> out;
  for (const MapObject& o : objects_) {
    if (o.type == type)
      out.push_back(&o);
  }
  return out;
}

std::vector<const MapObject*> TileMap::objectsByName(std::string_view name) const {
  std::vector<const MapObject*> out;
  for (const MapObject& o : objects_) {
    if (o.name == name)
      out.push_back(&o);
  }
  return out;
}

const MapObject* TileMap::findSpawn(std::string_view name) const {
  for (const MapObject& o : objects_) {
    if (o.name == name && o.type == "spawn")
      return &o;
  }
  return nullptr;
}

void TileMap::objectFeet(const MapObject& obj, float& outX, float& outY) const {
  outX = (static_cast<float>(obj.x) + 0.5F) * tileSize();
  outY = static_cast<float>(obj.y + 1) * tileSize();
}

int TileMap::tilesetColumns(int imageW) const {
  const int step = tileSize_ + spacing_;
  if (step <= 0)
    return 0;
  return std::max(0, (imageW - 2 * margin_ + spacing_) / step);
}

IntRect TileMap::tilesetRect(int tileId, int imageW) const {
  const int columns = tilesetColumns(imageW);
  if (tileId < 0 || columns <= 0)
    return {};
  const int col = tileId % columns;
  const int row = tileId / columns;
  return IntRect{margin_ + col * (tileSize_ + spacing_), margin_ + row * (tileSize_ + spacing_),
                 tileSize_, tileSize_};
}
