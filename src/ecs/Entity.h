#pragma once

#include <entt/entt.hpp>

using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;

[[nodiscard]] inline bool entityAlive(const entt::registry& registry, EntityId id) {
  return id != kInvalidEntity && registry.valid(id);
}
