#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "anim/AssetRegistry.h"
#include "core/DebugUI.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/SpriteCache.h"
#include "core/Time.h"
#include "ecs/Entity.h"
#include "ecs/World.h"
#include "world/Camera.h"
#include "world/TileMap.h"

struct AppConfig {
  std::string mapPath = "data/maps/demo.json";
  std::string playerPath = "data/player.toml";
  std::string enemiesDir = "data/enemies";
  std::string collectiblesDir = "data/collectibles";
  const char* inputScriptPath = nullptr;
  const char* argv0 = nullptr;
  const char* title = "Darkvania";
  int width = 1280;
  int height = 720;
  int scale = 2;       // tiles and sprites
  int maxFrames = -1;  // <= 0 runs until quit
};

class App {
 public:
  bool init(const AppConfig& cfg);
  void run();
  void shutdown();

 private:
  bool loadContent();
  bool loadPrototypes(Prototypes& out);
  [[nodiscard]] std::string resolve(std::string_view path) const;
  void refreshMapModel();

  void handleEvent(const SDL_Event& e);
  void handleCommands(const AppCommands& cmds);
  void tick(TimeStep ts);
  void updateCamera(float dt, bool snap);

  void render();
  void renderTiles();
  void renderSprite(EntityId id, SDL_Color placeholder);
  void renderDebugBoxes();
  void renderDebugUi();
  void fillWorldRect(const Rect& r, SDL_Color c, bool outline);

  AppConfig cfg_{};
  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  const char* basePath_ = nullptr;
  bool running_ = true;
  bool sdlReady_ = false;

  bool debugOverlay_ = false;
  bool debugCollision_ = false;
  TimeStep lastTs_{};
  uint64_t simFrame_ = 0;

  Input input_;
  InputScript inputScript_;
  bool inputScriptEnabled_ = false;
  DebugUI debugUi_;
  DebugUIMapModel mapModel_{};
  SpriteCache sprites_;
  SDL_Texture* tileset_ = nullptr;
  int tilesetW_ = 0;

  AssetRegistry assets_;
  TileMap map_;
  Camera camera_;
  World world_;
};
