#pragma once
#include <cstdio>
#include <string>
#include <utility>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <ripple/core/log.hpp>
#include <ripple/core/observable.hpp>

namespace ripple {

struct fmt_formatter {
  template <class T>
  std::string operator()(const T& v) const { return fmt::format("{}", v); }
};

// dump(name, formatter): subscribes and prints every event to stdout, e.g.
//   numbers on_next: 1
//   numbers on_completed
// Returns the subscription.
template <class Formatter>
struct op_dump {
  std::string name;
  Formatter format;
  template <class T>
  subscription operator()(const observable<T>& src) const {
    const std::string prefix = name.empty() ? std::string{} : name + " ";
    return src.subscribe(
      [prefix, format = format](const T& v){ fmt::print("{}on_next: {}\n", prefix, format(v)); },
      [prefix](std::exception_ptr e){ fmt::print("{}on_error: {}\n", prefix, describe(e)); },
      [prefix]{ fmt::print("{}on_completed\n", prefix); }
    );
  }
};

template <class Formatter = fmt_formatter>
inline auto dump(std::string name = {}, Formatter format = {}) {
  return op_dump<Formatter>{ std::move(name), std::move(format) };
}

} // namespace ripple
