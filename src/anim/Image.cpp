#include "anim/Image.h"

#include <algorithm>
#include <cstring>
#include <utility>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"  // NOLINT(build/include_subdir)

Image::Image(int w, int h)
    : w_(std::max(0, w)),
      h_(std::max(0, h)),
      pixels_(static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_) * 4U, 0) {}

Image Image::solid(int w, int h, Rgba8 color) {
  Image img(w, h);
  for (int y = 0; y < img.h_; ++y) {
    for (int x = 0; x < img.w_; ++x) {
      img.set(x, y, color);
    }
  }
  return img;
}

bool Image::loadFile(const std::string& path, Image& out, std::string* error) {
  int width = 0;
  int height = 0;
  int channels = 0;

  // Request RGBA (4 channels)
  unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);
  if (!data) {
    if (error) {
      const char* reason = stbi_failure_reason();
      *error = (reason != nullptr) ? reason : "unknown stb_image failure";
    }
    return false;
  }

  Image img(width, height);
  std::memcpy(img.pixels_.data(), data, img.pixels_.size());
  stbi_image_free(data);

  out = std::move(img);
  return true;
}

Rgba8 Image::at(int x, int y) const {
  if (x < 0 || y < 0 || x >= w_ || y >= h_)
    return {};
  const std::size_t i = (static_cast<std::size_t>(y) * w_ + x) * 4U;
  return {pixels_[i], pixels_[i + 1], pixels_[i + 2], pixels_[i + 3]};
}

void Image::set(int x, int y, Rgba8 c) {
  if (x < 0 || y < 0 || x >= w_ || y >= h_)
    return;
  const std::size_t i = (static_cast<std::size_t>(y) * w_ + x) * 4U;
  pixels_[i] = c.r;
  pixels_[i + 1] = c.g;
  pixels_[i + 2] = c.b;
  pixels_[i + 3] = c.a;
}

Image Image::crop(int x, int y, int w, int h) const {
  Image out(w, h);
  for (int row = 0; row < out.h_; ++row) {
    for (int col = 0; col < out.w_; ++col) {
      out.set(col, row, at(x + col, y + row));
    }
  }
  return out;
}

Image Image::flippedX() const {
  Image out(w_, h_);
  for (int row = 0; row < h_; ++row) {
    for (int col = 0; col < w_; ++col) {
      out.set(w_ - 1 - col, row, at(col, row));
    }
  }
  return out;
}

Image Image::scaledNearest(int factor) const {
  if (factor <= 1)
    return *this;
  Image out(w_ * factor, h_ * factor);
  for (int row = 0; row < out.h_; ++row) {
    for (int col = 0; col < out.w_; ++col) {
      out.set(col, row, at(col / factor, row / factor));
    }
  }
  return out;
}

void Image::blit(const Image& src, int dstX, int dstY) {
  for (int row = 0; row < src.h_; ++row) {
    for (int col = 0; col < src.w_; ++col) {
      set(dstX + col, dstY + row, src.at(col, row));
    }
  }
}
