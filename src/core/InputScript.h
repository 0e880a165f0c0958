#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "ecs/Components.h"

// Scripted controller: TOML keyframes that set or clear buttons from a given frame on.
// Used for unattended runs and for tests.
class InputScript {
 public:
  bool loadFromToml(const char* path);
  void reset();
  InputState sample(uint64_t frame);

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] std::size_t keyframeCount() const { return keyframes_.size(); }
  // Frame of the last keyframe, 0 when empty.
  [[nodiscard]] uint64_t lastKeyframe() const;

 private:
  enum Button : uint32_t {
    kLeft = 1U << 0U,
    kRight = 1U << 1U,
    kUp = 1U << 2U,
    kDown = 1U << 3U,
    kJump = 1U << 4U,
    kAttack = 1U << 5U,
    kDash = 1U << 6U,
    kRoll = 1U << 7U,
  };

  struct Keyframe {
    uint64_t frame = 0;
    uint32_t mask = 0;    // buttons this keyframe mentions
    uint32_t values = 0;  // their new held state
  };

  bool appendFromToml(const std::filesystem::path& path, std::unordered_set<std::string>& seen);

  std::vector<Keyframe> keyframes_;
  uint32_t held_ = 0;
  uint32_t prevHeld_ = 0;
  std::size_t nextIndex_ = 0;
  uint64_t lastFrame_ = 0;
  bool hasLastFrame_ = false;
  bool loaded_ = false;
  std::string path_;
};
