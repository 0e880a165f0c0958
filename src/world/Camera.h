#pragma once

#include "world/TileMap.h"

// Smoothed follow camera. (x, y) is the top-left of the viewport in world pixels.
class Camera {
 public:
  struct Tuning {
    float lerpSpeed = 8.0F;  // higher = catches up faster
    float deadZoneW = 10.0F;
    float deadZoneH = 10.0F;
    float lookahead = 50.0F;
    float lookaheadMinSpeed = 10.0F;  // |vx| above which lookahead builds up
    float lookaheadGrow = 3.0F;
    float lookaheadDecay = 2.0F;
  };

  void setViewport(int w, int h);
  void setWorldBounds(float w, float h);
  void setTuning(const Tuning& tuning) { tuning_ = tuning; }

  void follow(float targetX, float targetY, float dt, float velocityX);
  void centerOn(float targetX, float targetY);
  void setPosition(float x, float y);

  [[nodiscard]] float x() const { return x_; }
  [[nodiscard]] float y() const { return y_; }
  [[nodiscard]] int viewW() const { return viewW_; }
  [[nodiscard]] int viewH() const { return viewH_; }
  [[nodiscard]] float lookaheadOffset() const { return lookahead_; }
  [[nodiscard]] Rect viewport() const;
  [[nodiscard]] bool isVisible(const Rect& r) const;

 private:
  void clampToWorld();

  Tuning tuning_{};
  int viewW_ = 800;
  int viewH_ = 450;
  float worldW_ = 0.0F;
  float worldH_ = 0.0F;
  float x_ = 0.0F;
  float y_ = 0.0F;
  float targetX_ = 0.0F;
  float targetY_ = 0.0F;
  float lookahead_ = 0.0F;
};
