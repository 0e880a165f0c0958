#include "anim/EntityAnimations.h"

#include <algorithm>
#include <format>

#include "anim/AnimationLoader.h"
#include "util/Log.h"

std::string AnimationBinding::tagFor(std::string_view state) const {
  for (const auto& [s, tag] : mapping) {
    if (s == state)
      return tag;
  }
  return std::string(state);
}

bool EntityAnimations::load(const AnimationBinding& binding, const AnimationSheetPtr& sheet) {
  states_.clear();
  borrowed_.clear();
  missingRequired_.clear();
  error_.clear();
  entityType_ = binding.entityType;
  sheet_ = sheet;
  placeholder_ = (sheet == nullptr) || sheet->placeholder;

  const char* where = binding.sheetPath.empty() ? nullptr : binding.sheetPath.c_str();

  if (placeholder_) {
    const int scale = std::max(1, binding.scale);
    const int size = binding.placeholder.size * scale;
    const Pivot pivot{static_cast<float>(binding.placeholder.size / 2 * scale),
                      static_cast<float>((binding.placeholder.size - 1) * scale)};
    const AnimationPtr anim =
        AnimationLoader::makePlaceholder(binding.entityType + ":placeholder", size, size,
                                         binding.placeholder.color, pivot,
                                         binding.placeholder.duration);
    for (const auto& [state, tag] : binding.mapping) {
      (void)tag;
      states_[state] = anim;
    }
    for (const std::string& state : binding.required) {
      states_[state] = anim;
    }
    states_[binding.baseline] = anim;
    return true;
  }

  for (const auto& [state, tag] : binding.mapping) {
    AnimationPtr anim = sheet->find(tag);
    if (anim && anim->valid()) {
      states_[state] = std::move(anim);
    }
  }

  if (!states_.contains(binding.baseline)) {
    error_ = std::format("{}: baseline state '{}' (tag '{}') is missing from the sheet",
                         binding.entityType, binding.baseline, binding.tagFor(binding.baseline));
    Log::errorf(where, "{}", error_);
    states_.clear();
    return false;
  }

  static const std::vector<std::string> kNoChain;
  for (const std::string& state : binding.required) {
    if (states_.contains(state))
      continue;
    missingRequired_.push_back(state);

    auto chainIt = binding.fallbacks.find(state);
    const std::vector<std::string>& chain =
        (chainIt != binding.fallbacks.end()) ? chainIt->second : kNoChain;
    if (bindFirstOf(state, chain) || bindFirstOf(state, binding.commonFallbacks)) {
      Log::warnf(where, "{}: required state '{}' (tag '{}') missing; using fallback",
                 binding.entityType, state, binding.tagFor(state));
      continue;
    }
    states_[state] = states_.at(binding.baseline);
    borrowed_.insert(state);
    Log::warnf(where, "{}: required state '{}' (tag '{}') missing; using '{}'",
               binding.entityType, state, binding.tagFor(state), binding.baseline);
  }

  // Optional states only borrow through their own chain.
  for (const auto& [state, tag] : binding.mapping) {
    (void)tag;
    if (states_.contains(state))
      continue;
    auto chainIt = binding.fallbacks.find(state);
    if (chainIt != binding.fallbacks.end()) {
      (void)bindFirstOf(state, chainIt->second);
    }
  }

  return true;
}

bool EntityAnimations::bindFirstOf(const std::string& state,
                                   const std::vector<std::string>& candidates) {
  for (const std::string& alt : candidates) {
    auto it = states_.find(alt);
    if (it != states_.end()) {
      states_[state] = it->second;
      borrowed_.insert(state);
      return true;
    }
  }
  return false;
}

AnimationPtr EntityAnimations::animation(std::string_view state) const {
  auto it = states_.find(state);
  return (it != states_.end()) ? it->second : nullptr;
}

bool EntityAnimations::hasAnimation(std::string_view state) const {
  const AnimationPtr anim = animation(state);
  return anim && anim->valid();
}

bool EntityAnimations::hasOwnAnimation(std::string_view state) const {
  return !placeholder_ && hasAnimation(state) && !borrowed_.contains(state);
}

int EntityAnimations::frameCount(std::string_view state) const {
  const AnimationPtr anim = animation(state);
  return anim ? anim->frameCount() : 0;
}

const AnimationFrame* EntityAnimations::frame(std::string_view state, int index) const {
  auto it = states_.find(state);
  if (it == states_.end() || !it->second)
    return nullptr;
  const Animation& anim = *it->second;
  if (index < 0 || index >= anim.frameCount())
    return nullptr;
  return &anim.frames[static_cast<std::size_t>(index)];
}

float EntityAnimations::frameDuration(std::string_view state, int index) const {
  const AnimationPtr anim = animation(state);
  if (!anim || index < 0 || index >= static_cast<int>(anim->durations.size()))
    return 0.0F;
  return anim->durations[static_cast<std::size_t>(index)];
}

const Image* EntityAnimations::frameSurface(std::string_view state,
                                            int index,
                                            bool facingRight) const {
  const AnimationFrame* f = frame(state, index);
  if (!f)
    return nullptr;
  return facingRight ? &f->right : &f->left;
}

Pivot EntityAnimations::framePivot(std::string_view state, int index, bool facingRight) const {
  const AnimationFrame* f = frame(state, index);
  if (!f)
    return {};
  return facingRight ? f->pivotRight : f->pivotLeft;
}

float EntityAnimations::totalDuration(std::string_view state) const {
  const AnimationPtr anim = animation(state);
  return anim ? anim->totalDuration() : 0.0F;
}

PlayDirection EntityAnimations::direction(std::string_view state) const {
  const AnimationPtr anim = animation(state);
  return anim ? anim->direction : PlayDirection::Forward;
}
