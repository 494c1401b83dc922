#pragma once
#include <fmt/format.h>
#include <cstdio>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

// Compile-time default threshold: 0=trace 1=debug 2=info 3=warn 4=error 5=off
#ifndef RIPPLE_LOG_LEVEL
#define RIPPLE_LOG_LEVEL 3
#endif

namespace ripple {

enum class log_level : int { trace = 0, debug, info, warn, error, off };

inline std::string_view to_string(log_level lvl) noexcept {
  switch (lvl) {
    case log_level::trace: return "trace";
    case log_level::debug: return "debug";
    case log_level::info:  return "info";
    case log_level::warn:  return "warn";
    case log_level::error: return "error";
    case log_level::off:   return "off";
  }
  return "?";
}

// Receives every formatted line at or above the current level.
using log_sink = std::function<void(log_level, std::string_view)>;

namespace detail {
struct log_state {
  log_level level{static_cast<log_level>(RIPPLE_LOG_LEVEL)};
  log_sink sink{};
};

inline log_state& logger() {
  static log_state st;
  return st;
}
} // namespace detail

inline void set_log_level(log_level lvl) noexcept { detail::logger().level = lvl; }
inline log_level get_log_level() noexcept { return detail::logger().level; }

// Replace the sink. An empty sink restores the default stderr printer.
inline void set_log_sink(log_sink sink) { detail::logger().sink = std::move(sink); }

inline bool should_log(log_level lvl) noexcept {
  auto cur = detail::logger().level;
  return cur != log_level::off && lvl != log_level::off && lvl >= cur;
}

template <class... Args>
inline void log(log_level lvl, fmt::format_string<Args...> fmt_str, Args&&... args) {
  if (!should_log(lvl)) return;
  std::string line = fmt::format(fmt_str, std::forward<Args>(args)...);
  auto& st = detail::logger();
  if (st.sink) {
    st.sink(lvl, line);
    return;
  }
  fmt::print(stderr, "[ripple] {}: {}\n", to_string(lvl), line);
}

// Best-effort description of an exception_ptr for log lines.
inline std::string describe(std::exception_ptr e) {
  if (!e) return "<null>";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "<non-std exception>";
  }
}

} // namespace ripple
