#pragma once

#include <string>

#include "anim/EntityAnimations.h"

AnimationBinding defaultAssassinAnimations();

// Enemy tuning. World pixels, px/s and seconds; a duration of 0 means "the length of the
// state's animation".
struct EnemyConfig {
  int version = 1;
  std::string id = "assassin";
  std::string displayName;

  struct Body {
    float w = 24.0F;
    float h = 40.0F;
  } body;

  struct Move {
    float speed = 90.0F;
    float gravity = 1400.0F;
    float maxFallSpeed = 900.0F;
    bool turnOnWall = true;
    bool turnOnEdge = true;
    float turnPause = 0.5F;  // idle after turning around
  } move;

  struct Ai {
    float aggroRange = 240.0F;
    float aggroHeight = 80.0F;
    float attackRange = 60.0F;
    float chaseSpeedScale = 1.3F;
    bool chainAttack2 = true;
  } ai;

  struct Combat {
    int health = 3;
    float iframes = 0.4F;
    float hitDuration = 0.0F;
    float deathDuration = 0.0F;
    float spawnDuration = 0.0F;
  } combat;

  struct FrameRange {
    int from = 0;
    int to = 0;
  };

  struct Attack {
    float attack1Duration = 0.0F;
    float attack2Duration = 0.0F;
    float cooldown = 1.2F;
    FrameRange active1{2, 4};
    FrameRange active2{2, 4};
    float hitboxW = 56.0F;
    float hitboxH = 36.0F;
    float offsetX = 6.0F;
    float offsetY = 0.0F;
    int damage = 1;
  } attack;

  AnimationBinding animations = defaultAssassinAnimations();

  bool loadFromToml(const char* path);
};
