#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct IntRect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;

  bool operator==(const IntRect&) const = default;
};

struct Pivot {
  float x = 0.0F;
  float y = 0.0F;

  bool operator==(const Pivot&) const = default;
};

enum class PlayDirection : std::uint8_t {
  Forward,
  Reverse,
  PingPong,
  PingPongReverse,
};

enum class SheetStatus : std::uint8_t {
  Ok,
  MissingFile,
  MalformedDescriptor,
  MissingImage,
};

const char* toString(SheetStatus status);
const char* toString(PlayDirection direction);

// Aseprite "JSON data" export, as written by File > Export Sprite Sheet.
struct SheetDescriptor {
  struct Frame {
    std::string name;
    IntRect rect;              // cell in the sheet image
    int durationMs = 100;      // per-frame duration
    bool trimmed = false;
    IntRect spriteSource;      // where rect sits inside the untrimmed frame
    int sourceW = 0;           // untrimmed frame size
    int sourceH = 0;
  };

  struct Tag {
    std::string name;
    int from = 0;  // inclusive, 0-based
    int to = 0;    // inclusive, 0-based
    PlayDirection direction = PlayDirection::Forward;
  };

  struct PivotKey {
    int frame = 0;
    Pivot pivot;  // bounds origin + pivot offset, untrimmed frame pixels
  };

  std::vector<Frame> frames;
  std::vector<Tag> tags;
  std::vector<PivotKey> pivotKeys;
  std::string image;  // meta.image, may be empty

  SheetStatus loadFromJson(const std::string& path);
  SheetStatus parse(std::string_view text, const char* path);

  [[nodiscard]] const Tag* findTag(std::string_view name) const;
  [[nodiscard]] std::optional<Pivot> pivotForFrame(int index) const;
};
