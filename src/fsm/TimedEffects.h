#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

enum class EffectKind : std::uint8_t {
  StateTimer,      // ends a timed state (attack, dash, roll, hit, spawn, death, trans)
  Invulnerable,
  ComboWindow,
  AttackCooldown,
  DashCooldown,
  WallGrace,       // wall hold -> wall slide
  ActionPause,     // enemy pause after turning, player steering lockout after a wall jump
  Count,
};

inline constexpr std::size_t kEffectKindCount = static_cast<std::size_t>(EffectKind::Count);

// One countdown slot per kind. Expired slots report the state they were set to hand over to.
template <typename State>
class TimedEffects {
 public:
  struct Effect {
    EffectKind kind = EffectKind::StateTimer;
    float remaining = 0.0F;
    std::optional<State> onExpire;
  };

  void start(EffectKind kind, float seconds, std::optional<State> onExpire = std::nullopt) {
    Slot& s = slots_[static_cast<std::size_t>(kind)];
    s.active = true;
    s.remaining = std::max(0.0F, seconds);
    s.onExpire = onExpire;
  }

  void cancel(EffectKind kind) { slots_[static_cast<std::size_t>(kind)] = Slot{}; }

  void clear() { slots_ = {}; }

  [[nodiscard]] bool active(EffectKind kind) const {
    return slots_[static_cast<std::size_t>(kind)].active;
  }

  [[nodiscard]] float remaining(EffectKind kind) const {
    const Slot& s = slots_[static_cast<std::size_t>(kind)];
    return s.active ? s.remaining : 0.0F;
  }

  // Counts every active slot down by dt; slots that reach zero are removed and returned
  // in kind order.
  std::vector<Effect> tick(float dt) {
    std::vector<Effect> expired;
    for (std::size_t i = 0; i < kEffectKindCount; ++i) {
      Slot& s = slots_[i];
      if (!s.active)
        continue;
      s.remaining -= dt;
      if (s.remaining <= 0.0F) {
        expired.push_back(Effect{static_cast<EffectKind>(i), 0.0F, s.onExpire});
        s = Slot{};
      }
    }
    return expired;
  }

 private:
  struct Slot {
    bool active = false;
    float remaining = 0.0F;
    std::optional<State> onExpire;
  };

  std::array<Slot, kEffectKindCount> slots_{};
};
