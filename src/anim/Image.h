#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Rgba8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 0;

  bool operator==(const Rgba8&) const = default;
};

// Tightly packed RGBA32 pixel buffer (row-major, 4 bytes per pixel).
class Image {
 public:
  Image() = default;
  Image(int w, int h);

  static Image solid(int w, int h, Rgba8 color);
  static bool loadFile(const std::string& path, Image& out, std::string* error = nullptr);

  [[nodiscard]] int width() const { return w_; }
  [[nodiscard]] int height() const { return h_; }
  [[nodiscard]] bool empty() const { return w_ <= 0 || h_ <= 0; }
  [[nodiscard]] const std::uint8_t* data() const { return pixels_.data(); }
  [[nodiscard]] int pitch() const { return w_ * 4; }

  [[nodiscard]] Rgba8 at(int x, int y) const;
  void set(int x, int y, Rgba8 c);

  // Copies a rectangle; parts outside the source come out transparent.
  [[nodiscard]] Image crop(int x, int y, int w, int h) const;
  [[nodiscard]] Image flippedX() const;
  [[nodiscard]] Image scaledNearest(int factor) const;
  void blit(const Image& src, int dstX, int dstY);

  bool operator==(const Image&) const = default;

 private:
  int w_ = 0;
  int h_ = 0;
  std::vector<std::uint8_t> pixels_;
};
