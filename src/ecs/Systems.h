#pragma once

class World;
struct InputState;

namespace Systems {
void player(World& w, const InputState& in, float dt);
void enemies(World& w, float dt);
void combat(World& w);
void hazards(World& w);
void collectibles(World& w, float dt);
void animate(World& w, float dt);
}  // namespace Systems
