#include "world/Camera.h"

#include <algorithm>
#include <cmath>

void Camera::setViewport(int w, int h) {
  viewW_ = std::max(1, w);
  viewH_ = std::max(1, h);
  clampToWorld();
}

void Camera::setWorldBounds(float w, float h) {
  worldW_ = std::max(0.0F, w);
  worldH_ = std::max(0.0F, h);
  clampToWorld();
}

void Camera::follow(float targetX, float targetY, float dt, float velocityX) {
  const float halfW = static_cast<float>(viewW_ / 2);
  const float halfH = static_cast<float>(viewH_ / 2);

  float desiredX = targetX - halfW;
  const float desiredY = targetY - halfH;

  if (std::fabs(velocityX) > tuning_.lookaheadMinSpeed) {
    const float want = (velocityX > 0.0F) ? tuning_.lookahead : -tuning_.lookahead;
    lookahead_ += (want - lookahead_) * dt * tuning_.lookaheadGrow;
  } else {
    lookahead_ += (0.0F - lookahead_) * dt * tuning_.lookaheadDecay;
  }
  desiredX += lookahead_;

  // Retarget only once the target leaves the dead zone around the view centre.
  const float dx = targetX - (x_ + halfW);
  const float dy = targetY - (y_ + halfH);
  if (std::fabs(dx) > tuning_.deadZoneW * 0.5F) {
    targetX_ = desiredX;
  }
  if (std::fabs(dy) > tuning_.deadZoneH * 0.5F) {
    targetY_ = desiredY;
  }

  const float t = std::min(1.0F, tuning_.lerpSpeed * dt);
  x_ += (targetX_ - x_) * t;
  y_ += (targetY_ - y_) * t;

  clampToWorld();
}

void Camera::centerOn(float targetX, float targetY) {
  x_ = targetX - static_cast<float>(viewW_ / 2);
  y_ = targetY - static_cast<float>(viewH_ / 2);
  targetX_ = x_;
  targetY_ = y_;
  lookahead_ = 0.0F;
  clampToWorld();
}

void Camera::setPosition(float x, float y) {
  x_ = x;
  y_ = y;
  targetX_ = x;
  targetY_ = y;
  clampToWorld();
}

Rect Camera::viewport() const {
  return Rect{x_, y_, static_cast<float>(viewW_), static_cast<float>(viewH_)};
}

bool Camera::isVisible(const Rect& r) const {
  return rectsOverlap(r, viewport());
}

void Camera::clampToWorld() {
  if (worldW_ <= 0.0F || worldH_ <= 0.0F) {
    return;
  }
  const float vw = static_cast<float>(viewW_);
  const float vh = static_cast<float>(viewH_);

  // A world narrower than the screen is centred instead of followed.
  if (worldW_ < vw) {
    x_ = std::floor((worldW_ - vw) * 0.5F);
    targetX_ = x_;
  } else {
    x_ = std::clamp(x_, 0.0F, worldW_ - vw);
    targetX_ = std::clamp(targetX_, 0.0F, worldW_ - vw);
  }

  if (worldH_ < vh) {
    y_ = std::floor((worldH_ - vh) * 0.5F);
    targetY_ = y_;
  } else {
    y_ = std::clamp(y_, 0.0F, worldH_ - vh);
    targetY_ = std::clamp(targetY_, 0.0F, worldH_ - vh);
  }
}
