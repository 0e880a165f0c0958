#include "core/SpriteCache.h"

#include <cstdint>
#include <string>

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_surface.h>

#include "util/Log.h"

void SpriteCache::init(SDL_Renderer* renderer) {
  renderer_ = renderer;
}

void SpriteCache::shutdown() {
  clear();
  renderer_ = nullptr;
}

void SpriteCache::clear() {
  for (auto& [image, tex] : frames_) {
    (void)image;
    if (tex)
      SDL_DestroyTexture(tex);
  }
  frames_.clear();
  for (auto& [path, tex] : files_) {
    (void)path;
    if (tex)
      SDL_DestroyTexture(tex);
  }
  files_.clear();
}

SDL_Texture* SpriteCache::get(const Image& image) {
  auto it = frames_.find(&image);
  if (it != frames_.end())
    return it->second;

  SDL_Texture* tex = upload(image, nullptr);
  frames_.emplace(&image, tex);
  return tex;
}

SDL_Texture* SpriteCache::get(const std::string& path) {
  auto it = files_.find(path);
  if (it != files_.end())
    return it->second;

  SDL_Texture* tex = nullptr;
  Image image;
  std::string error;
  if (Image::loadFile(path, image, &error)) {
    tex = upload(image, path.c_str());
  } else {
    Log::warnf(path.c_str(), "{}", error);
  }
  // A null entry stops a broken file from being decoded every frame.
  files_.emplace(path, tex);
  return tex;
}

SDL_Texture* SpriteCache::upload(const Image& image, const char* what) {
  if (!renderer_ || image.empty())
    return nullptr;

  // The surface borrows the pixels; the texture gets its own copy.
  SDL_Surface* surface = SDL_CreateSurfaceFrom(image.width(), image.height(),
                                               SDL_PIXELFORMAT_RGBA32,
                                               const_cast<std::uint8_t*>(image.data()),
                                               image.pitch());
  if (!surface) {
    Log::warnf(what, "SDL_CreateSurfaceFrom failed: {}", SDL_GetError());
    return nullptr;
  }

  SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer_, surface);
  SDL_DestroySurface(surface);
  if (!tex) {
    Log::warnf(what, "SDL_CreateTextureFromSurface failed: {}", SDL_GetError());
    return nullptr;
  }

  (void)SDL_SetTextureScaleMode(tex, SDL_SCALEMODE_NEAREST);
  (void)SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
  return tex;
}
