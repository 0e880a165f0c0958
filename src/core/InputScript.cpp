#include "core/InputScript.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

struct ButtonKey {
  std::string_view key;
  uint32_t bit;
};

constexpr std::array<ButtonKey, 8> kButtonKeys{{
    {"left", 1U << 0U},
    {"right", 1U << 1U},
    {"up", 1U << 2U},
    {"down", 1U << 3U},
    {"jump", 1U << 4U},
    {"attack", 1U << 5U},
    {"dash", 1U << 6U},
    {"roll", 1U << 7U},
}};

bool isHeld(uint32_t bits, uint32_t bit) {
  return (bits & bit) != 0U;
}

}  // namespace

bool InputScript::appendFromToml(const std::filesystem::path& path,
                                 std::unordered_set<std::string>& seen) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!seen.insert(pathStr).second) {
    Log::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& err) {
    Log::errorf(pathStr.c_str(), "{}", err.description());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, pathStr.c_str(), "root", {"version", "keyframes", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>())
    version = *v;
  if (version != 1) {
    Log::warnf(pathStr.c_str(), "input script version {} (expected 1)", version);
  }

  if (auto include = tbl["include"].value<std::string>()) {
    const std::filesystem::path includePath = normalized.parent_path() / *include;
    if (!appendFromToml(includePath, seen)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    Log::warnf(pathStr.c_str(), "include must be a string path");
  }

  const toml::array* framesArr = tbl["keyframes"].as_array();
  if (!framesArr)
    return true;

  std::size_t idx = 0;
  for (const auto& node : *framesArr) {
    const std::string scope = "keyframes[" + std::to_string(idx++) + "]";
    auto t = node.as_table();
    if (!t) {
      Log::warnf(pathStr.c_str(), "{} must be a table", scope);
      continue;
    }

    TomlUtil::warnUnknownKeys(*t, pathStr.c_str(), scope,
                              {"frame", "left", "right", "up", "down", "jump", "attack", "dash",
                               "roll"});

    const int64_t f = t->get("frame") ? t->get("frame")->value_or(int64_t{-1}) : -1;
    if (f < 0) {
      Log::warnf(pathStr.c_str(), "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = static_cast<uint64_t>(f);
    for (const ButtonKey& b : kButtonKeys) {
      const toml::node* v = t->get(b.key);
      if (!v)
        continue;
      kf.mask |= b.bit;
      if (v->value_or(false))
        kf.values |= b.bit;
    }
    keyframes_.push_back(kf);
  }

  return true;
}

bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  reset();
  loaded_ = false;
  path_ = path ? path : "";

  std::unordered_set<std::string> seen;
  if (!appendFromToml(path_, seen)) {
    return false;
  }

  std::stable_sort(keyframes_.begin(), keyframes_.end(),
                   [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });

  loaded_ = true;
  return true;
}

void InputScript::reset() {
  held_ = 0;
  prevHeld_ = 0;
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
}

uint64_t InputScript::lastKeyframe() const {
  return keyframes_.empty() ? 0 : keyframes_.back().frame;
}

InputState InputScript::sample(uint64_t frame) {
  if (!loaded_)
    return InputState{};

  if (!hasLastFrame_ || frame < lastFrame_) {
    reset();
  }

  while (nextIndex_ < keyframes_.size() && keyframes_[nextIndex_].frame <= frame) {
    const Keyframe& kf = keyframes_[nextIndex_];
    held_ = (held_ & ~kf.mask) | (kf.values & kf.mask);
    ++nextIndex_;
  }

  auto pressed = [this](uint32_t bit) { return isHeld(held_, bit) && !isHeld(prevHeld_, bit); };

  InputState out{};
  out.left = isHeld(held_, kLeft);
  out.right = isHeld(held_, kRight);
  out.upHeld = isHeld(held_, kUp);
  out.downHeld = isHeld(held_, kDown);
  out.downPressed = pressed(kDown);
  out.jumpHeld = isHeld(held_, kJump);
  out.jumpPressed = pressed(kJump);
  out.jumpReleased = !isHeld(held_, kJump) && isHeld(prevHeld_, kJump);
  out.attackHeld = isHeld(held_, kAttack);
  out.attackPressed = pressed(kAttack);
  out.dashHeld = isHeld(held_, kDash);
  out.dashPressed = pressed(kDash);
  out.rollHeld = isHeld(held_, kRoll);
  out.rollPressed = pressed(kRoll);

  prevHeld_ = held_;
  lastFrame_ = frame;
  hasLastFrame_ = true;
  return out;
}
