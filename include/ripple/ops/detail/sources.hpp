#pragma once
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>

namespace ripple {
namespace detail {

// (sources..., f) or (sources...): calls impl(f_or_fallback, sources...).
template <class Fallback, class Impl, class... Args>
auto split_trailing_fn(Fallback fallback, Impl impl, Args&&... args) {
  constexpr std::size_t N = sizeof...(Args);
  static_assert(N > 0, "at least one source expected");
  using Last = std::decay_t<std::tuple_element_t<N - 1, std::tuple<Args...>>>;
  auto all = std::forward_as_tuple(std::forward<Args>(args)...);
  if constexpr (is_observable_v<Last>) {
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
      return impl(std::move(fallback), std::get<I>(all)...);
    }(std::make_index_sequence<N>{});
  } else {
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
      return impl(std::get<N - 1>(all), std::get<I>(all)...);
    }(std::make_index_sequence<N - 1>{});
  }
}

// Default combinator of zip/combine_latest: the values as a tuple.
struct make_tuple_fn {
  template <class... Vs>
  auto operator()(const Vs&... vs) const { return std::tuple<Vs...>(vs...); }
};

} // namespace detail
} // namespace ripple
