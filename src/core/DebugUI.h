#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ImGui integration is optional and debug-only. Builds without ImGui support get a
// no-op implementation.

struct DebugUIOverlayModel {
  uint64_t frame = 0;
  float dt = 0.0F;
  bool debugCollision = false;
  float camX = 0.0F;
  float camY = 0.0F;

  bool hasPlayer = false;
  std::string playerName;
  std::string state;
  int animFrame = 0;
  int animFrames = 0;
  float posX = 0.0F;
  float posY = 0.0F;
  float velX = 0.0F;
  float velY = 0.0F;
  bool onGround = false;
  int facingX = 1;
  int health = 0;
  int maxHealth = 0;
  float invulnerable = 0.0F;  // seconds left
  int jumpsUsed = 0;

  int enemies = 0;
  int collectibles = 0;
  int hurtEvents = 0;
  int enemyKills = 0;
  int respawns = 0;
  int pickups = 0;
  int warnings = 0;
  int errors = 0;
};

struct DebugUIMapModel {
  std::string mapPath;
  std::string tilesetPath;
  int cols = 0;
  int rows = 0;
  float tileSize = 0.0F;
  std::size_t layerCount = 0;
  std::size_t objectCount = 0;
  std::vector<std::string> objects;  // "name (type) @ x,y"
  std::vector<std::string> missingRequired;  // "entity: state"
  std::vector<std::string> legend;
};

class DebugUI {
 public:
  bool init(SDL_Window* window, SDL_Renderer* renderer);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  static bool available();
  bool initialized() const { return initialized_; }

  bool wantCaptureKeyboard() const;

  void drawOverlay(const DebugUIOverlayModel& model);
  void drawMapInspector(const DebugUIMapModel& model);

 private:
  bool initialized_ = false;
  std::string iniPath_;
};
