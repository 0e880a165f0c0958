#pragma once

#include <string>

#include "anim/EntityAnimations.h"

AnimationBinding defaultPlayerAnimations();

// Player tuning. Distances are world pixels (already scaled), speeds px/s, times seconds.
// A duration of 0 means "the length of the state's animation".
struct PlayerConfig {
  int version = 1;
  std::string id = "player";
  int maxHealth = 2;

  struct Body {
    float w = 24.0F;
    float h = 40.0F;
  } body;

  struct Move {
    float speed = 160.0F;
    float jumpSpeed = 700.0F;
    float gravity = 1400.0F;
    float maxFallSpeed = 900.0F;
    int maxJumps = 2;
  } move;

  struct Dash {
    float duration = 0.6F;
    float speed = 320.0F;
    float cooldown = 1.0F;
  } dash;

  struct Roll {
    float duration = 0.0F;
    float speed = 260.0F;
  } roll;

  struct FrameRange {
    int from = 0;
    int to = 0;
  };

  struct Attack {
    float attack1Duration = 0.7F;
    float attack2Duration = 0.5F;
    float comboWindow = 0.7F;
    float cooldown = 0.3F;
    float attack1MoveScale = 0.2F;
    float attack2MoveScale = 0.1F;
    FrameRange active1{1, 3};
    FrameRange active2{1, 3};
    float hitboxW = 80.0F;
    float hitboxH = 50.0F;
    float offsetX = 10.0F;  // gap between the body centre and the near edge of the box
    float offsetY = 5.0F;   // box bottom below the feet
    int damage = 1;
  } attack;

  struct Combat {
    float invulnerability = 1.0F;
    float hitDuration = 0.0F;
    float deathDuration = 0.0F;
    float hitSpeedScale = 0.5F;  // horizontal speed kept when hurt
  } combat;

  struct Spawn {
    float duration = 0.6F;
  } spawn;

  struct Wall {
    bool enabled = true;
    float holdGrace = 0.25F;   // hold before sliding
    float slideSpeed = 120.0F;
    float jumpSpeedX = 220.0F;
    float jumpLockout = 0.15F;  // horizontal input ignored after a wall jump
    float ledgeReach = 10.0F;
  } wall;

  AnimationBinding animations = defaultPlayerAnimations();

  bool loadFromToml(const char* path);
};
