#pragma once

#include <SDL3/SDL_render.h>

#include <string>
#include <unordered_map>

#include "anim/Image.h"

// GPU copies of decoded images. Frames are keyed by the address of their Image, which
// stays stable while the owning sheet is alive in the asset registry.
class SpriteCache {
 public:
  void init(SDL_Renderer* renderer);
  void shutdown();

  SDL_Texture* get(const Image& image);
  // Decodes an image file (tilesets). Failures are remembered and reported once.
  SDL_Texture* get(const std::string& path);

  // Drops every texture; call after the asset registry reloads.
  void clear();

 private:
  SDL_Texture* upload(const Image& image, const char* what);

  SDL_Renderer* renderer_ = nullptr;
  std::unordered_map<const Image*, SDL_Texture*> frames_;
  std::unordered_map<std::string, SDL_Texture*> files_;
};
