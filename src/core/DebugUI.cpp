#include "core/DebugUI.h"

#ifndef DARKVANIA_WITH_IMGUI
#define DARKVANIA_WITH_IMGUI 0
#endif

#if DARKVANIA_WITH_IMGUI
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>
#endif

#include <memory>

#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_stdinc.h>

bool DebugUI::available() {
  return DARKVANIA_WITH_IMGUI != 0;
}

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer) {
#if DARKVANIA_WITH_IMGUI
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  iniPath_.clear();
  using PrefPathPtr = std::unique_ptr<char, decltype(&SDL_free)>;
  PrefPathPtr prefPath{SDL_GetPrefPath("darkvania", "darkvania"), SDL_free};
  if (prefPath) {
    iniPath_ = std::string(prefPath.get()) + "imgui.ini";
    io.IniFilename = iniPath_.c_str();  // keep window layout out of the data directory
  } else {
    io.IniFilename = nullptr;
  }
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
#else
  (void)window;
  (void)renderer;
  return false;
#endif
}

void DebugUI::shutdown() {
#if DARKVANIA_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
#endif
}

void DebugUI::processEvent(const SDL_Event& e) {
#if DARKVANIA_WITH_IMGUI
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
#else
  (void)e;
#endif
}

void DebugUI::beginFrame() {
#if DARKVANIA_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
#endif
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
#if DARKVANIA_WITH_IMGUI
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
#else
  (void)renderer;
#endif
}

bool DebugUI::wantCaptureKeyboard() const {
#if DARKVANIA_WITH_IMGUI
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
#else
  return false;
#endif
}

// NOLINTNEXTLINE
void DebugUI::drawOverlay(const DebugUIOverlayModel& model) {
#if DARKVANIA_WITH_IMGUI
  if (!initialized_)
    return;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 16.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.75F);

  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;

  if (ImGui::Begin("Overlay", nullptr, flags)) {
    ImGui::Text("frame: %llu  dt: %.5F", static_cast<unsigned long long>(model.frame), model.dt);
    ImGui::Text("camera: (%.1F, %.1F)  collision boxes: %d (F3)", model.camX, model.camY,
                model.debugCollision ? 1 : 0);

    if (model.hasPlayer) {
      ImGui::Separator();
      ImGui::Text("player: %s", model.playerName.c_str());
      ImGui::Text("state: %s  frame %d/%d", model.state.c_str(), model.animFrame + 1,
                  model.animFrames);
      ImGui::Text("pos: (%.1F, %.1F)", model.posX, model.posY);
      ImGui::Text("vel: (%.1F, %.1F)", model.velX, model.velY);
      ImGui::Text("ground: %d  facing: %d  jumps used: %d", model.onGround ? 1 : 0,
                  model.facingX, model.jumpsUsed);
      ImGui::Text("health: %d/%d", model.health, model.maxHealth);
      if (model.invulnerable > 0.0F)
        ImGui::Text("invulnerable: %.2Fs", model.invulnerable);
    }

    ImGui::Separator();
    ImGui::Text("enemies: %d  pickups left: %d", model.enemies, model.collectibles);
    ImGui::Text("hurt=%d  kills=%d  respawns=%d  picked=%d", model.hurtEvents, model.enemyKills,
                model.respawns, model.pickups);
    if (model.warnings > 0 || model.errors > 0) {
      ImGui::TextColored(ImVec4(1.0F, 0.75F, 0.3F, 1.0F), "warnings: %d  errors: %d",
                         model.warnings, model.errors);
    }
  }
  ImGui::End();
#else
  (void)model;
#endif
}

void DebugUI::drawMapInspector(const DebugUIMapModel& model) {
#if DARKVANIA_WITH_IMGUI
  if (!initialized_)
    return;

  ImGui::SetNextWindowPos(ImVec2(560.0F, 16.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.90F);

  if (ImGui::Begin("Map", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
    ImGui::Text("map: %s", model.mapPath.empty() ? "(built-in test map)" : model.mapPath.c_str());
    ImGui::Text("tileset: %s", model.tilesetPath.empty() ? "-" : model.tilesetPath.c_str());
    ImGui::Text("grid: %dx%d  tile: %.0F px  layers: %zu", model.cols, model.rows, model.tileSize,
                model.layerCount);

    if (ImGui::CollapsingHeader("Objects")) {
      ImGui::Text("%zu objects", model.objectCount);
      for (const std::string& line : model.objects)
        ImGui::BulletText("%s", line.c_str());
    }

    if (!model.missingRequired.empty() && ImGui::CollapsingHeader("Animation fallbacks")) {
      for (const std::string& line : model.missingRequired)
        ImGui::BulletText("%s", line.c_str());
    }

    if (ImGui::CollapsingHeader("Controls", ImGuiTreeNodeFlags_DefaultOpen)) {
      for (const std::string& line : model.legend)
        ImGui::TextUnformatted(line.c_str());
    }
  }
  ImGui::End();
#else
  (void)model;
#endif
}
