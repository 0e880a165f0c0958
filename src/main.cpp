#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace {

void usage(const char* argv0) {
  std::printf(
      "usage: %s [--map PATH] [--player PATH] [--frames N] [--video-driver NAME] "
      "[--width W] [--height H] [--scale S] [--input-script PATH]\n",
      argv0);
  std::printf("  --map PATH           Map JSON (default: data/maps/demo.json)\n");
  std::printf("  --player PATH        Player config TOML (default: data/player.toml)\n");
  std::printf("  --frames N           Run N frames then exit (smoke test)\n");
  std::printf("  --video-driver NAME  Force SDL video backend (e.g. x11, wayland, offscreen)\n");
  std::printf("  --width W            Window width (default: 1280)\n");
  std::printf("  --height H           Window height (default: 720)\n");
  std::printf("  --scale S            Tile and sprite scale factor (default: 2)\n");
  std::printf("  --input-script PATH  Drive the player from a TOML keyframe script\n");
  std::printf("  -h, --help           Show this help\n");
}

bool parseInt(const char* s, int& out, long lo, long hi) {
  if (!s || !*s)
    return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0')
    return false;
  if (v < lo || v > hi)
    return false;
  out = static_cast<int>(v);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  AppConfig cfg{};
  cfg.argv0 = argv[0];
  const char* videoDriver = nullptr;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    const bool hasValue = i + 1 < argc;
    if (arg == "--frames") {
      if (!hasValue || !parseInt(argv[i + 1], cfg.maxFrames, 1, 100000000)) {
        std::printf("invalid --frames value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--map" || arg == "--player" || arg == "--video-driver" ||
               arg == "--input-script") {
      if (!hasValue) {
        std::printf("missing %s value\n", argv[i]);
        usage(argv[0]);
        return 1;
      }
      const char* value = argv[++i];
      if (arg == "--map") {
        cfg.mapPath = value;
      } else if (arg == "--player") {
        cfg.playerPath = value;
      } else if (arg == "--video-driver") {
        videoDriver = value;
      } else {
        cfg.inputScriptPath = value;
      }
    } else if (arg == "--width") {
      if (!hasValue || !parseInt(argv[i + 1], cfg.width, 1, 100000)) {
        std::printf("invalid --width value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--height") {
      if (!hasValue || !parseInt(argv[i + 1], cfg.height, 1, 100000)) {
        std::printf("invalid --height value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--scale") {
      if (!hasValue || !parseInt(argv[i + 1], cfg.scale, 1, 8)) {
        std::printf("invalid --scale value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  if (videoDriver) {
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, videoDriver);
  }

  App app;
  if (!app.init(cfg)) {
    app.shutdown();
    return 1;
  }

  app.run();
  app.shutdown();
  return 0;
}
