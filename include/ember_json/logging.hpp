/**
 * @file logging.hpp
 * @brief Ember JSON - levelled diagnostics with a replaceable sink
 *
 * Messages are formatted with {fmt} and handed to the installed sink.
 * The default sink writes to stderr; the default level is Warn, so decode
 * traces (Debug) are only produced when explicitly enabled.
 *
 * License: MIT
 */

#ifndef EMBER_JSON_LOGGING_HPP
#define EMBER_JSON_LOGGING_HPP

#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace ember {
namespace json {
namespace logging {

enum class Level { Debug = 0, Info, Warn, Error, Off };

using Sink = std::function<void(Level, std::string_view)>;

inline const char *level_name(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  default:
    return "OFF";
  }
}

namespace detail {

struct State {
  std::mutex mutex;
  Level level = Level::Warn;
  Sink sink;
};

inline State &state() {
  static State s;
  return s;
}

inline void stderr_sink(Level level, std::string_view msg) {
  fmt::print(stderr, "[ember_json] {}: {}\n", level_name(level), msg);
}

} // namespace detail

inline void set_level(Level level) {
  auto &s = detail::state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.level = level;
}

inline Level level() {
  auto &s = detail::state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.level;
}

// An empty sink restores the stderr default.
inline void set_sink(Sink sink) {
  auto &s = detail::state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.sink = std::move(sink);
}

inline bool enabled(Level l) {
  return l != Level::Off && l >= level();
}

template <typename... Args>
void write(Level l, fmt::format_string<Args...> format, Args &&...args) {
  if (!enabled(l))
    return;
  std::string msg = fmt::format(format, std::forward<Args>(args)...);

  Sink sink;
  {
    auto &s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    sink = s.sink;
  }
  if (sink)
    sink(l, msg);
  else
    detail::stderr_sink(l, msg);
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args &&...args) {
  write(Level::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args &&...args) {
  write(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args &&...args) {
  write(Level::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args &&...args) {
  write(Level::Error, format, std::forward<Args>(args)...);
}

} // namespace logging
} // namespace json
} // namespace ember

#endif // EMBER_JSON_LOGGING_HPP
