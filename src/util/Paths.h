#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Paths {

inline std::string fileStem(std::string_view p) {
  return std::filesystem::path(p).stem().string();
}

inline bool pathExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

// Tries the path as given, then next to the executable and one level above it, then the
// same two spots under basePath (the platform's application base directory, may be null).
inline std::string resolveAssetPath(std::string_view relativePath,
                                    const char* argv0 = nullptr,
                                    const char* basePath = nullptr) {
  namespace fs = std::filesystem;

  fs::path rel(relativePath);
  if (rel.empty() || rel.is_absolute() || pathExists(rel)) {
    return rel.string();
  }

  auto tryBase = [&rel](const fs::path& base, std::string& out) {
    fs::path candidate = base / rel;
    if (pathExists(candidate)) {
      out = candidate.lexically_normal().string();
      return true;
    }
    candidate = base / ".." / rel;
    if (pathExists(candidate)) {
      out = candidate.lexically_normal().string();
      return true;
    }
    return false;
  };

  std::string out;
  if ((argv0 != nullptr) && (*argv0 != 0)) {
    std::error_code ec;
    fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (!ec && tryBase(exe.parent_path(), out)) {
      return out;
    }
  }

  if ((basePath != nullptr) && (*basePath != 0) && tryBase(fs::path(basePath), out)) {
    return out;
  }

  return rel.string();
}

// Path of a file named by a descriptor, relative to the descriptor's directory.
inline std::string siblingPath(std::string_view descriptorPath, std::string_view name) {
  namespace fs = std::filesystem;
  fs::path p(name);
  if (p.is_absolute()) {
    return p.string();
  }
  return (fs::path(descriptorPath).parent_path() / p).lexically_normal().string();
}

// Image that goes with a sheet descriptor when meta.image is absent: same stem, .png.
inline std::string defaultSheetImagePath(std::string_view descriptorPath) {
  std::filesystem::path p(descriptorPath);
  p.replace_extension(".png");
  return p.string();
}

inline std::vector<std::string> listFiles(std::string_view dirPath, std::string_view extension) {
  namespace fs = std::filesystem;
  std::vector<std::string> out;

  std::error_code ec;
  for (const auto& e : fs::directory_iterator(fs::path(dirPath), ec)) {
    if (ec) {
      break;
    }
    if (!e.is_regular_file()) {
      continue;
    }
    const fs::path& p = e.path();
    if (p.extension() != extension) {
      continue;
    }
    out.push_back(p.string());
  }

  std::sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
    const std::string sa = fileStem(a);
    const std::string sb = fileStem(b);
    if (sa != sb) {
      return sa < sb;
    }
    return a < b;
  });

  return out;
}

}  // namespace Paths
