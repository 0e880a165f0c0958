#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>

// state -> set of allowed next states, one bitmask row per state. Built in a constexpr
// lambda so the rows can be checked with static_assert where the table is defined.
template <typename State, std::size_t N>
class TransitionTable {
  static_assert(N <= 64, "one bit per state");

 public:
  constexpr TransitionTable& allow(State from, std::initializer_list<State> to) {
    for (State s : to) {
      rows_[index(from)] |= bit(s);
    }
    return *this;
  }

  // Every state may be entered from anywhere except the listed ones (and itself).
  constexpr TransitionTable& allowFromAllExcept(State to, std::initializer_list<State> except) {
    for (std::size_t i = 0; i < N; ++i) {
      if (i == index(to))
        continue;
      bool skip = false;
      for (State s : except) {
        skip = skip || (index(s) == i);
      }
      if (!skip)
        rows_[i] |= bit(to);
    }
    return *this;
  }

  [[nodiscard]] constexpr bool allowed(State from, State to) const {
    return (rows_[index(from)] & bit(to)) != 0U;
  }

  [[nodiscard]] constexpr bool hasExit(State from) const {
    return (rows_[index(from)] & ~bit(from)) != 0U;
  }

  [[nodiscard]] constexpr bool reachable(State to) const {
    for (std::size_t i = 0; i < N; ++i) {
      if (i != index(to) && (rows_[i] & bit(to)) != 0U)
        return true;
    }
    return false;
  }

  [[nodiscard]] constexpr bool everyStateHasExit() const {
    for (std::size_t i = 0; i < N; ++i) {
      if ((rows_[i] & ~(std::uint64_t{1} << i)) == 0U)
        return false;
    }
    return true;
  }

 private:
  static constexpr std::size_t index(State s) { return static_cast<std::size_t>(s); }
  static constexpr std::uint64_t bit(State s) { return std::uint64_t{1} << index(s); }

  std::array<std::uint64_t, N> rows_{};
};
