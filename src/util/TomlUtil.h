#pragma once

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <toml++/toml.h>

#include "util/Log.h"

namespace TomlUtil {

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    Log::warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// Reads an array of strings; non-string entries are reported and skipped.
inline std::vector<std::string> readStringArray(const toml::array& arr,
                                                const char* path,
                                                std::string_view scope) {
  std::vector<std::string> out;
  out.reserve(arr.size());
  for (const auto& node : arr) {
    if (auto s = node.value<std::string>()) {
      out.push_back(*s);
    } else {
      Log::warnf(path, "{} must contain only strings", scope);
    }
  }
  return out;
}

// [section] name = "value" pairs, in key order.
inline std::vector<std::pair<std::string, std::string>> readStringPairs(const toml::table& tbl,
                                                                        const char* path,
                                                                        std::string_view scope) {
  std::vector<std::pair<std::string, std::string>> out;
  for (const auto& [key, node] : tbl) {
    if (auto s = node.value<std::string>()) {
      out.emplace_back(std::string(key.str()), *s);
    } else {
      Log::warnf(path, "{}.{} must be a string", scope, key.str());
    }
  }
  return out;
}

// [section] name = ["a", "b"] lists.
inline std::unordered_map<std::string, std::vector<std::string>> readStringLists(
    const toml::table& tbl,
    const char* path,
    std::string_view scope) {
  std::unordered_map<std::string, std::vector<std::string>> out;
  for (const auto& [key, node] : tbl) {
    const std::string name(key.str());
    if (auto arr = node.as_array()) {
      out[name] = readStringArray(*arr, path, std::string(scope) + "." + name);
    } else {
      Log::warnf(path, "{}.{} must be an array of strings", scope, name);
    }
  }
  return out;
}

}  // namespace TomlUtil
