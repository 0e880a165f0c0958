#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "anim/SheetDescriptor.h"

struct Rect {
  float x = 0.0F;
  float y = 0.0F;
  float w = 0.0F;
  float h = 0.0F;
};

inline bool rectsOverlap(const Rect& a, const Rect& b) {
  return a.x < b.x + b.w && a.x + a.w > b.x && a.y < b.y + b.h && a.y + a.h > b.y;
}

enum class TileCollision : std::uint8_t {
  None,
  Solid,
  Platform,  // one-way: blocks landing from above only
  Damage,
  Water,
  Ice,
  Trigger,
};

const char* toString(TileCollision c);
std::optional<TileCollision> parseTileCollision(std::string_view s);

struct MapObject {
  std::string name;
  std::string type;
  int x = 0;  // tile column
  int y = 0;  // tile row
  std::unordered_map<std::string, std::string> properties;
};

struct TileLayer {
  std::string name;
  std::vector<int> tiles;  // cols * rows, -1 = empty
};

class TileMap {
 public:
  static constexpr int kEmpty = -1;

  void loadTestMap(int scale = 2);
  bool loadFromJson(const char* path, int scale);
  bool parse(std::string_view text, const char* path, int scale);

  [[nodiscard]] int cols() const { return cols_; }
  [[nodiscard]] int rows() const { return rows_; }
  [[nodiscard]] int scale() const { return scale_; }
  [[nodiscard]] int sourceTileSize() const { return tileSize_; }
  [[nodiscard]] float tileSize() const { return static_cast<float>(tileSize_ * scale_); }
  [[nodiscard]] int margin() const { return margin_; }
  [[nodiscard]] int spacing() const { return spacing_; }
  [[nodiscard]] const std::string& tilesetPath() const { return tilesetPath_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] const std::vector<TileLayer>& layers() const { return layers_; }
  [[nodiscard]] const std::vector<MapObject>& objects() const { return objects_; }

  [[nodiscard]] int tileAt(std::size_t layer, int col, int row) const;
  [[nodiscard]] bool inBounds(int col, int row) const;
  [[nodiscard]] int cellX(float worldX) const;
  [[nodiscard]] int cellY(float worldY) const;

  // O(1): class by tile id, and a per-cell class precomputed at load time.
  [[nodiscard]] TileCollision collisionOfTile(int tileId) const;
  [[nodiscard]] TileCollision collisionAtCell(int col, int row) const;
  [[nodiscard]] TileCollision collisionAt(float worldX, float worldY) const;
  [[nodiscard]] bool isSolidAt(float worldX, float worldY) const;
  [[nodiscard]] bool isPlatformAt(float worldX, float worldY) const;
  [[nodiscard]] bool isDamageAt(float worldX, float worldY) const;

  [[nodiscard]] Rect worldBounds() const;

  [[nodiscard]] std::vector<const MapObject*> objectsByType(std::string_view type) const;
  [[nodiscard]] std::vector<const MapObject*> objectsByName(std::string_view name) const;
  [[nodiscard]] const MapObject* findSpawn(std::string_view name) const;

  // World position of an object's feet: bottom centre of its tile.
  void objectFeet(const MapObject& obj, float& outX, float& outY) const;

  // Source rect of a tile id inside the tileset image (unscaled pixels).
  [[nodiscard]] int tilesetColumns(int imageW) const;
  [[nodiscard]] IntRect tilesetRect(int tileId, int imageW) const;

 private:
  void rebuildCollisionGrid();
  void reset();

  int cols_ = 0;
  int rows_ = 0;
  int tileSize_ = 16;
  int margin_ = 0;
  int spacing_ = 0;
  int scale_ = 1;
  std::string path_;
  std::string tilesetPath_;
  std::vector<TileLayer> layers_;
  std::vector<TileCollision> tileClasses_;  // by tile id
  std::vector<TileCollision> cellClasses_;  // by cell, topmost colliding tile wins
  std::vector<MapObject> objects_;
};
