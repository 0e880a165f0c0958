#include "core/App.h"

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_init.h>
#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_rect.h>
#include <SDL3/SDL_timer.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <format>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "anim/EntityAnimations.h"
#include "character/PlayerController.h"
#include "enemy/EnemyController.h"
#include "util/Log.h"
#include "util/Paths.h"
#include "world/Physics.h"

namespace {

SDL_Color colorFor(TileCollision c) {
  switch (c) {
    case TileCollision::Solid:
      return {70, 70, 92, 255};
    case TileCollision::Platform:
      return {120, 96, 64, 255};
    case TileCollision::Damage:
      return {170, 40, 40, 255};
    case TileCollision::Water:
      return {40, 80, 170, 160};
    case TileCollision::Ice:
      return {150, 210, 230, 255};
    case TileCollision::Trigger:
      return {60, 150, 60, 90};
    case TileCollision::None:
      break;
  }
  return {45, 45, 55, 255};
}

template <typename Config>
void loadConfigDir(const std::vector<std::string>& files,
                   std::unordered_map<std::string, Config>& out) {
  for (const std::string& file : files) {
    Config cfg;
    if (!cfg.loadFromToml(file.c_str()))
      continue;
    out[cfg.id] = std::move(cfg);
  }
}

}  // namespace

std::string App::resolve(std::string_view path) const {
  return Paths::resolveAssetPath(path, cfg_.argv0, basePath_);
}

bool App::init(const AppConfig& cfg) {
  cfg_ = cfg;

  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD)) {
    std::printf("SDL_Init failed: %s\n", SDL_GetError());
    return false;
  }
  sdlReady_ = true;
  basePath_ = SDL_GetBasePath();

  window_ = SDL_CreateWindow(cfg_.title, cfg_.width, cfg_.height, SDL_WINDOW_RESIZABLE);
  if (!window_) {
    std::printf("SDL_CreateWindow failed: %s\n", SDL_GetError());
    return false;
  }

  renderer_ = SDL_CreateRenderer(window_, nullptr);
  if (renderer_) {
    SDL_SetRenderVSync(renderer_, 1);
    SDL_SetRenderLogicalPresentation(renderer_, cfg_.width, cfg_.height,
                                     SDL_LOGICAL_PRESENTATION_LETTERBOX);
  } else {
    std::printf("SDL_CreateRenderer failed: %s\n", SDL_GetError());
    return false;
  }

  sprites_.init(renderer_);
  input_.init();
  if (DebugUI::available() && !debugUi_.init(window_, renderer_)) {
    Log::warnf(nullptr, "debug UI failed to initialise; overlay disabled");
  }

  if (cfg_.inputScriptPath) {
    const std::string scriptPath = resolve(cfg_.inputScriptPath);
    if (!inputScript_.loadFromToml(scriptPath.c_str())) {
      std::printf("input script failed to load: %s\n", scriptPath.c_str());
      return false;
    }
    inputScriptEnabled_ = true;
  }

  return loadContent();
}

bool App::loadPrototypes(Prototypes& out) {
  const std::string playerPath = resolve(cfg_.playerPath);
  if (Paths::pathExists(playerPath)) {
    if (!out.player.loadFromToml(playerPath.c_str()))
      return false;
  } else {
    Log::warnf(playerPath.c_str(), "player config not found; using built-in defaults");
  }

  loadConfigDir(Paths::listFiles(resolve(cfg_.enemiesDir), ".toml"), out.enemies);
  if (out.enemies.empty()) {
    EnemyConfig assassin;
    out.enemies[assassin.id] = std::move(assassin);
  }

  loadConfigDir(Paths::listFiles(resolve(cfg_.collectiblesDir), ".toml"), out.collectibles);
  if (out.collectibles.empty()) {
    CollectibleConfig bandage;
    out.collectibles[bandage.id] = std::move(bandage);
  }

  // Sheet paths in configs are relative to the data root, like every other asset.
  auto fixSheet = [this](AnimationBinding& b) {
    b.sheetPath = resolve(b.sheetPath);
    b.scale = cfg_.scale;
  };
  fixSheet(out.player.animations);
  for (auto& [id, enemy] : out.enemies) {
    (void)id;
    fixSheet(enemy.animations);
  }
  for (auto& [id, item] : out.collectibles) {
    (void)id;
    fixSheet(item.animations);
  }
  return true;
}

bool App::loadContent() {
  const std::string mapPath = resolve(cfg_.mapPath);
  if (!map_.loadFromJson(mapPath.c_str(), cfg_.scale)) {
    Log::warnf(mapPath.c_str(), "using the built-in test map");
    map_.loadTestMap(cfg_.scale);
  }

  tileset_ = nullptr;
  tilesetW_ = 0;
  if (!map_.tilesetPath().empty()) {
    tileset_ = sprites_.get(map_.tilesetPath());
    float w = 0.0F;
    float h = 0.0F;
    if (tileset_ && SDL_GetTextureSize(tileset_, &w, &h)) {
      tilesetW_ = static_cast<int>(w);
    } else {
      tileset_ = nullptr;
    }
  }

  Prototypes protos;
  if (!loadPrototypes(protos)) {
    Log::errorf(nullptr, "player configuration is invalid");
    return false;
  }
  if (!world_.load(map_, assets_, protos)) {
    std::printf("configuration error: %s\n", world_.error().c_str());
    return false;
  }

  const Rect bounds = map_.worldBounds();
  camera_.setViewport(cfg_.width, cfg_.height);
  camera_.setWorldBounds(bounds.w, bounds.h);
  updateCamera(0.0F, true);
  refreshMapModel();
  return true;
}

void App::refreshMapModel() {
  mapModel_ = DebugUIMapModel{};
  mapModel_.mapPath = map_.path();
  mapModel_.tilesetPath = map_.tilesetPath();
  mapModel_.cols = map_.cols();
  mapModel_.rows = map_.rows();
  mapModel_.tileSize = map_.tileSize();
  mapModel_.layerCount = map_.layers().size();
  mapModel_.objectCount = map_.objects().size();
  for (const MapObject& obj : map_.objects()) {
    mapModel_.objects.push_back(std::format("{} ({}) @ {},{}", obj.name, obj.type, obj.x, obj.y));
  }

  auto addMissing = [this](const std::shared_ptr<const EntityAnimations>& anims) {
    if (!anims)
      return;
    for (const std::string& state : anims->missingRequired())
      mapModel_.missingRequired.push_back(anims->entityType() + ": " + state);
  };
  if (const PlayerController* pc = world_.playerController())
    addMissing(pc->animations());
  world_.registry.view<EnemyBrain>().each(
      [&](const EnemyBrain& brain) { addMissing(brain.ctl->animations()); });
  std::sort(mapModel_.missingRequired.begin(), mapModel_.missingRequired.end());
  mapModel_.missingRequired.erase(
      std::unique(mapModel_.missingRequired.begin(), mapModel_.missingRequired.end()),
      mapModel_.missingRequired.end());

  input_.appendLegend(mapModel_.legend);
}

void App::run() {
  uint64_t lastTicks = SDL_GetTicks();
  int frames = 0;

  while (running_) {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
      handleEvent(e);
    }
    handleCommands(input_.consumeCommands());

    const uint64_t now = SDL_GetTicks();
    float dt = static_cast<float>(now - lastTicks) / 1000.0F;
    dt = std::min(dt, kMaxFrameDt);
    lastTicks = now;

    TimeStep ts{};
    ts.dt = dt;
    ts.frame = simFrame_;
    tick(ts);
    render();

    if (cfg_.maxFrames > 0) {
      ++frames;
      if (frames >= cfg_.maxFrames) {
        running_ = false;
      }
    }
  }

  if (Log::warningCount() > 0 || Log::errorCount() > 0) {
    std::printf("darkvania: %d warning(s), %d error(s)\n", Log::warningCount(),
                Log::errorCount());
  }
}

void App::shutdown() {
  debugUi_.shutdown();
  sprites_.shutdown();
  assets_.clear();
  input_.shutdown();

  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }

  if (sdlReady_) {
    SDL_Quit();
    sdlReady_ = false;
  }
}

void App::handleEvent(const SDL_Event& e) {
  if (e.type == SDL_EVENT_QUIT) {
    running_ = false;
    return;
  }

  debugUi_.processEvent(e);
  const bool keyEvent = e.type == SDL_EVENT_KEY_DOWN || e.type == SDL_EVENT_KEY_UP;
  if (keyEvent && debugUi_.wantCaptureKeyboard())
    return;
  input_.handleEvent(e);
}

void App::handleCommands(const AppCommands& cmds) {
  if (cmds.quit)
    running_ = false;
  if (cmds.toggleDebugOverlay)
    debugOverlay_ = !debugOverlay_;
  if (cmds.toggleDebugCollision)
    debugCollision_ = !debugCollision_;
}

void App::tick(TimeStep ts) {
  lastTs_ = ts;
  InputState in = input_.consume();
  if (inputScriptEnabled_) {
    in = inputScript_.sample(simFrame_);
  }

  world_.update(in, ts);
  ++simFrame_;
  updateCamera(ts.dt, false);
}

void App::updateCamera(float dt, bool snap) {
  if (!entityAlive(world_.registry, world_.player))
    return;
  const auto& t = world_.registry.get<Transform>(world_.player);
  const auto& v = world_.registry.get<Velocity>(world_.player);
  const auto& box = world_.registry.get<AABB>(world_.player);
  const float cy = t.pos.y - box.h * 0.5F;
  if (snap) {
    camera_.centerOn(t.pos.x, cy);
  } else {
    camera_.follow(t.pos.x, cy, dt, v.v.x);
  }
}

void App::fillWorldRect(const Rect& r, SDL_Color c, bool outline) {
  const SDL_FRect dst{std::floor(r.x - camera_.x()), std::floor(r.y - camera_.y()), r.w, r.h};
  SDL_SetRenderDrawColor(renderer_, c.r, c.g, c.b, c.a);
  if (outline) {
    SDL_RenderRect(renderer_, &dst);
  } else {
    SDL_RenderFillRect(renderer_, &dst);
  }
}

void App::renderTiles() {
  const float ts = map_.tileSize();
  if (ts <= 0.0F)
    return;

  const Rect view = camera_.viewport();
  const int c0 = std::max(0, map_.cellX(view.x));
  const int r0 = std::max(0, map_.cellY(view.y));
  const int c1 = std::min(map_.cols() - 1, map_.cellX(view.x + view.w));
  const int r1 = std::min(map_.rows() - 1, map_.cellY(view.y + view.h));

  for (std::size_t layer = 0; layer < map_.layers().size(); ++layer) {
    for (int row = r0; row <= r1; ++row) {
      for (int col = c0; col <= c1; ++col) {
        const int id = map_.tileAt(layer, col, row);
        if (id == TileMap::kEmpty)
          continue;
        const Rect cell{static_cast<float>(col) * ts, static_cast<float>(row) * ts, ts, ts};
        if (tileset_) {
          const IntRect src = map_.tilesetRect(id, tilesetW_);
          const SDL_FRect s{static_cast<float>(src.x), static_cast<float>(src.y),
                            static_cast<float>(src.w), static_cast<float>(src.h)};
          const SDL_FRect d{std::floor(cell.x - camera_.x()), std::floor(cell.y - camera_.y()),
                            cell.w, cell.h};
          SDL_RenderTexture(renderer_, tileset_, &s, &d);
        } else {
          fillWorldRect(cell, colorFor(map_.collisionOfTile(id)), false);
        }
      }
    }
  }
}

void App::renderSprite(EntityId id, SDL_Color placeholder) {
  const auto& t = world_.registry.get<Transform>(id);
  const auto& anim = world_.registry.get<AnimPlayback>(id);
  const auto* animated = world_.registry.try_get<Animated>(id);

  const bool facingRight = anim.facingX >= 0;
  const Image* image = nullptr;
  Pivot pivot{};
  if (animated && animated->anims && !anim.state.empty()) {
    image = animated->anims->frameSurface(anim.state, anim.cursor.frame, facingRight);
    pivot = animated->anims->framePivot(anim.state, anim.cursor.frame, facingRight);
  }

  SDL_Texture* tex = image ? sprites_.get(*image) : nullptr;
  if (!tex) {
    const auto* box = world_.registry.try_get<AABB>(id);
    const Rect r = box ? Physics::bodyRect(t, *box) : Rect{t.pos.x - 8.0F, t.pos.y - 16.0F, 16, 16};
    fillWorldRect(r, placeholder, false);
    return;
  }

  const SDL_FRect dst{std::floor(t.pos.x - pivot.x - camera_.x()),
                      std::floor(t.pos.y - pivot.y - camera_.y()),
                      static_cast<float>(image->width()), static_cast<float>(image->height())};
  SDL_RenderTexture(renderer_, tex, nullptr, &dst);
}

void App::renderDebugBoxes() {
  const SDL_Color body{0, 255, 120, 255};
  const SDL_Color hit{255, 60, 60, 255};

  auto bodies = world_.registry.view<Transform, AABB>();
  for (auto e : bodies) {
    fillWorldRect(Physics::bodyRect(bodies.get<Transform>(e), bodies.get<AABB>(e)), body, true);
  }

  if (const PlayerController* pc = world_.playerController();
      pc && entityAlive(world_.registry, world_.player)) {
    const auto& rt = world_.registry.get<PlayerRuntime>(world_.player);
    const auto& anim = world_.registry.get<AnimPlayback>(world_.player);
    if (pc->attackActive(rt, anim.cursor.frame)) {
      fillWorldRect(pc->attackBox(rt, world_.registry.get<Transform>(world_.player)), hit, true);
    }
  }

  auto enemies = world_.registry.view<EnemyRuntime, EnemyBrain, Transform, AnimPlayback>();
  for (auto e : enemies) {
    const auto& rt = enemies.get<EnemyRuntime>(e);
    const auto& brain = enemies.get<EnemyBrain>(e);
    if (brain.ctl->attackActive(rt, enemies.get<AnimPlayback>(e).cursor.frame)) {
      fillWorldRect(brain.ctl->attackBox(rt, enemies.get<Transform>(e)), hit, true);
    }
  }
}

void App::renderDebugUi() {
  DebugUIOverlayModel m{};
  m.frame = lastTs_.frame;
  m.dt = lastTs_.dt;
  m.debugCollision = debugCollision_;
  m.camX = camera_.x();
  m.camY = camera_.y();

  if (entityAlive(world_.registry, world_.player)) {
    const auto& rt = world_.registry.get<PlayerRuntime>(world_.player);
    const auto& t = world_.registry.get<Transform>(world_.player);
    const auto& v = world_.registry.get<Velocity>(world_.player);
    const auto& anim = world_.registry.get<AnimPlayback>(world_.player);
    const auto& animated = world_.registry.get<Animated>(world_.player);
    m.hasPlayer = true;
    m.playerName = world_.registry.get<DebugName>(world_.player).name;
    m.state = toString(rt.state);
    m.animFrame = anim.cursor.frame;
    m.animFrames = animated.anims ? animated.anims->frameCount(anim.state) : 0;
    m.posX = t.pos.x;
    m.posY = t.pos.y;
    m.velX = v.v.x;
    m.velY = v.v.y;
    m.onGround = rt.onGround;
    m.facingX = rt.facingX;
    m.health = rt.health;
    m.maxHealth = rt.maxHealth;
    m.invulnerable = rt.effects.remaining(EffectKind::Invulnerable);
    m.jumpsUsed = rt.jumpsUsed;
  }

  m.enemies = static_cast<int>(world_.registry.view<EnemyTag>().size());
  m.collectibles = static_cast<int>(world_.registry.view<CollectibleTag>().size());
  m.hurtEvents = world_.hurtEvents;
  m.enemyKills = world_.enemyKills;
  m.respawns = world_.respawns;
  m.pickups = world_.pickups;
  m.warnings = Log::warningCount();
  m.errors = Log::errorCount();

  debugUi_.drawOverlay(m);
  debugUi_.drawMapInspector(mapModel_);
}

void App::render() {
  if (!renderer_) {
    return;
  }

  SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
  SDL_SetRenderDrawColor(renderer_, 16, 14, 24, 255);
  SDL_RenderClear(renderer_);

  renderTiles();

  for (auto e : world_.registry.view<CollectibleTag>()) {
    renderSprite(e, SDL_Color{255, 100, 100, 255});
  }
  for (auto e : world_.registry.view<EnemyTag>()) {
    renderSprite(e, SDL_Color{255, 80, 80, 255});
  }
  if (entityAlive(world_.registry, world_.player)) {
    const auto& rt = world_.registry.get<PlayerRuntime>(world_.player);
    // Blink while invulnerable.
    const bool hidden = rt.invulnerable() && !rt.dead() && ((simFrame_ / 4U) % 2U) == 1U;
    if (!hidden)
      renderSprite(world_.player, SDL_Color{80, 150, 255, 255});
  }

  if (debugCollision_) {
    renderDebugBoxes();
  }

  if (debugOverlay_ && debugUi_.initialized()) {
    debugUi_.beginFrame();
    renderDebugUi();
    debugUi_.endFrame(renderer_);
  }

  SDL_RenderPresent(renderer_);
}
