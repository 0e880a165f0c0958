#include "anim/SheetDescriptor.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "util/Log.h"

using Json = nlohmann::ordered_json;

namespace {

IntRect readRect(const Json& j) {
  IntRect r{};
  r.x = j.at("x").get<int>();
  r.y = j.at("y").get<int>();
  r.w = j.at("w").get<int>();
  r.h = j.at("h").get<int>();
  return r;
}

std::optional<PlayDirection> parseDirection(std::string_view value) {
  if (value == "forward")
    return PlayDirection::Forward;
  if (value == "reverse")
    return PlayDirection::Reverse;
  if (value == "pingpong")
    return PlayDirection::PingPong;
  if (value == "pingpong_reverse")
    return PlayDirection::PingPongReverse;
  return std::nullopt;
}

SheetDescriptor::Frame readFrame(const Json& j, std::string name) {
  SheetDescriptor::Frame f{};
  f.name = std::move(name);
  f.rect = readRect(j.at("frame"));
  if (auto it = j.find("duration"); it != j.end() && it->is_number()) {
    f.durationMs = std::max(1, it->get<int>());
  }
  f.trimmed = j.value("trimmed", false);
  f.spriteSource = IntRect{0, 0, f.rect.w, f.rect.h};
  f.sourceW = f.rect.w;
  f.sourceH = f.rect.h;
  if (auto it = j.find("spriteSourceSize"); it != j.end() && it->is_object()) {
    f.spriteSource = readRect(*it);
  }
  if (auto it = j.find("sourceSize"); it != j.end() && it->is_object()) {
    f.sourceW = it->at("w").get<int>();
    f.sourceH = it->at("h").get<int>();
  }
  return f;
}

}  // namespace

const char* toString(SheetStatus status) {
  switch (status) {
    case SheetStatus::Ok:
      return "ok";
    case SheetStatus::MissingFile:
      return "missing file";
    case SheetStatus::MalformedDescriptor:
      return "malformed descriptor";
    case SheetStatus::MissingImage:
      return "missing image";
  }
  return "unknown";
}

const char* toString(PlayDirection direction) {
  switch (direction) {
    case PlayDirection::Forward:
      return "forward";
    case PlayDirection::Reverse:
      return "reverse";
    case PlayDirection::PingPong:
      return "pingpong";
    case PlayDirection::PingPongReverse:
      return "pingpong_reverse";
  }
  return "forward";
}

SheetStatus SheetDescriptor::loadFromJson(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return SheetStatus::MissingFile;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse(ss.str(), path.c_str());
}

SheetStatus SheetDescriptor::parse(std::string_view text, const char* path) {
  SheetDescriptor next{};

  try {
    const Json root = Json::parse(text);
    if (!root.is_object()) {
      Log::warnf(path, "sheet descriptor root must be an object");
      return SheetStatus::MalformedDescriptor;
    }

    const auto framesIt = root.find("frames");
    if (framesIt == root.end()) {
      Log::warnf(path, "sheet descriptor has no 'frames'");
      return SheetStatus::MalformedDescriptor;
    }
    if (framesIt->is_object()) {
      // Hash export: frame order is the key order in the file.
      for (const auto& [name, frame] : framesIt->items()) {
        next.frames.push_back(readFrame(frame, name));
      }
    } else if (framesIt->is_array()) {
      for (const auto& frame : *framesIt) {
        next.frames.push_back(readFrame(frame, frame.value("filename", std::string{})));
      }
    } else {
      Log::warnf(path, "'frames' must be an object or an array");
      return SheetStatus::MalformedDescriptor;
    }

    if (next.frames.empty()) {
      Log::warnf(path, "sheet descriptor has no frames");
      return SheetStatus::MalformedDescriptor;
    }

    const int frameCount = static_cast<int>(next.frames.size());
    const auto metaIt = root.find("meta");
    if (metaIt != root.end() && metaIt->is_object()) {
      const Json& meta = *metaIt;
      next.image = meta.value("image", std::string{});

      if (auto tagsIt = meta.find("frameTags"); tagsIt != meta.end() && tagsIt->is_array()) {
        for (const auto& t : *tagsIt) {
          Tag tag{};
          tag.name = t.at("name").get<std::string>();
          tag.from = t.at("from").get<int>();
          tag.to = t.at("to").get<int>();
          const std::string dir = t.value("direction", std::string{"forward"});
          if (auto d = parseDirection(dir)) {
            tag.direction = *d;
          } else {
            Log::warnf(path, "tag '{}' has unknown direction '{}'; playing forward", tag.name,
                       dir);
          }
          if (tag.from < 0 || tag.to >= frameCount || tag.from > tag.to) {
            Log::warnf(path, "tag '{}' range {}..{} is outside 0..{}; skipped", tag.name, tag.from,
                       tag.to, frameCount - 1);
            continue;
          }
          next.tags.push_back(std::move(tag));
        }
      }

      if (auto slicesIt = meta.find("slices"); slicesIt != meta.end() && slicesIt->is_array()) {
        for (const auto& slice : *slicesIt) {
          if (slice.value("name", std::string{}) != "Pivot")
            continue;
          const auto keysIt = slice.find("keys");
          if (keysIt == slice.end() || !keysIt->is_array())
            continue;
          for (const auto& key : *keysIt) {
            const auto pivotIt = key.find("pivot");
            if (pivotIt == key.end())
              continue;
            const IntRect bounds = readRect(key.at("bounds"));
            PivotKey pk{};
            pk.frame = key.value("frame", 0);
            pk.pivot.x = static_cast<float>(bounds.x) + pivotIt->at("x").get<float>();
            pk.pivot.y = static_cast<float>(bounds.y) + pivotIt->at("y").get<float>();
            next.pivotKeys.push_back(pk);
          }
          break;
        }
        std::stable_sort(next.pivotKeys.begin(), next.pivotKeys.end(),
                         [](const PivotKey& a, const PivotKey& b) { return a.frame < b.frame; });
      }
    }
  } catch (const nlohmann::json::exception& e) {
    Log::warnf(path, "malformed sheet descriptor: {}", e.what());
    return SheetStatus::MalformedDescriptor;
  }

  *this = std::move(next);
  return SheetStatus::Ok;
}

const SheetDescriptor::Tag* SheetDescriptor::findTag(std::string_view name) const {
  for (const Tag& t : tags) {
    if (t.name == name)
      return &t;
  }
  return nullptr;
}

std::optional<Pivot> SheetDescriptor::pivotForFrame(int index) const {
  if (pivotKeys.empty())
    return std::nullopt;
  // A key holds from its frame until the next key; frames before the first key use it too.
  Pivot p = pivotKeys.front().pivot;
  for (const PivotKey& k : pivotKeys) {
    if (k.frame > index)
      break;
    p = k.pivot;
  }
  return p;
}
