#pragma once

#include <string>

#include "anim/EntityAnimations.h"

AnimationBinding defaultCollectibleAnimations(const std::string& id);

// A pickup placed by a map object of type "collectible"; the object's name selects the id.
struct CollectibleConfig {
  int version = 1;
  std::string id = "bandage";
  std::string displayName;

  struct Collision {
    float w = 32.0F;
    float h = 32.0F;
  } collision;

  struct Value {
    int health = 1;
  } value;

  // World pixels; bobSpeed is the sine phase rate in radians per second.
  struct Float {
    float height = 64.0F;
    float amplitude = 16.0F;
    float bobSpeed = 2.0F;
  } hover;

  AnimationBinding animations = defaultCollectibleAnimations("bandage");

  bool loadFromToml(const char* path);
};
