#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace Log {

inline int& warningCounter() {
  static int counter = 0;
  return counter;
}

inline int& errorCounter() {
  static int counter = 0;
  return counter;
}

inline void resetCounts() {
  warningCounter() = 0;
  errorCounter() = 0;
}

inline int warningCount() {
  return warningCounter();
}

inline int errorCount() {
  return errorCounter();
}

inline void writeLine(FILE* out,
                      std::string_view prefix,
                      std::string_view level,
                      std::string_view message) {
  (void)std::fwrite(prefix.data(), 1, prefix.size(), out);
  (void)std::fwrite(level.data(), 1, level.size(), out);
  (void)std::fwrite(message.data(), 1, message.size(), out);
  (void)std::fwrite("\n", 1, 1, out);
}

inline std::string_view where(const char* path) {
  return (path != nullptr) ? std::string_view{path} : std::string_view{"darkvania"};
}

template <typename... Args>
inline void infof(std::format_string<Args...> fmt, Args&&... args) {
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  std::printf("%s\n", message.c_str());
}

// "<path>: warning: <message>" on stderr. Content problems that the game recovers from.
template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  writeLine(stderr, where(path), ": warning: ", message);
}

// "<path>: error: <message>" on stderr. Configuration errors and broken invariants.
template <typename... Args>
inline void errorf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++errorCounter();
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  writeLine(stderr, where(path), ": error: ", message);
}

}  // namespace Log
