#pragma once
#include <exception>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <ripple/core/observer.hpp>

namespace ripple {

// Multi-value events are tuples. The arity is part of the type, so trailing values
// are never dropped.
template <class... Args>
inline auto pack(Args&&... args) {
  return std::tuple<std::decay_t<Args>...>(std::forward<Args>(args)...);
}

template <class F, class Tuple>
inline decltype(auto) unpack(F&& f, Tuple&& t) {
  return std::apply(std::forward<F>(f), std::forward<Tuple>(t));
}

// spread(f): adapts f(a, b, ...) to a callable taking one tuple.
template <class F>
inline auto spread(F f) {
  return [f = std::move(f)](const auto& tup) -> decltype(auto) { return std::apply(f, tup); };
}

struct identity_fn {
  template <class T>
  constexpr std::decay_t<T> operator()(T&& v) const { return std::forward<T>(v); }
};
inline constexpr identity_fn identity{};

template <class V>
inline auto constant(V v) {
  return [v = std::move(v)](auto&&...) { return v; };
}

struct noop_fn {
  template <class... Args>
  constexpr void operator()(Args&&...) const noexcept {}
};
inline constexpr noop_fn noop{};

using eq_fn = std::equal_to<>;
inline constexpr eq_fn eq{};

// Contextual truthiness, the default predicate of filter/reject/all/...
struct truthy_fn {
  template <class T>
  constexpr bool operator()(const T& v) const { return static_cast<bool>(v); }
};
inline constexpr truthy_fn truthy{};

// Runs fn(args...). If it throws, the exception goes to o.on_error and false is returned.
// Every operator that calls user code goes through here (or invoke_guarded).
template <class T, class F, class... Args>
inline bool run_guarded(const observer<T>& o, F&& fn, Args&&... args) {
  try {
    std::invoke(std::forward<F>(fn), std::forward<Args>(args)...);
    return true;
  } catch (...) {
    o.on_error(std::current_exception());
    return false;
  }
}

// Value-returning form: nullopt means the call threw and the error was forwarded.
template <class T, class F, class... Args>
inline auto invoke_guarded(const observer<T>& o, F&& fn, Args&&... args)
    -> std::optional<std::decay_t<std::invoke_result_t<F, Args...>>> {
  using R = std::decay_t<std::invoke_result_t<F, Args...>>;
  std::optional<R> out;
  try {
    out.emplace(std::invoke(std::forward<F>(fn), std::forward<Args>(args)...));
  } catch (...) {
    out.reset();
    o.on_error(std::current_exception());
  }
  return out;
}

namespace detail {
template <class T>
struct is_tuple : std::false_type {};
template <class... Ts>
struct is_tuple<std::tuple<Ts...>> : std::true_type {};
} // namespace detail

template <class T>
inline constexpr bool is_tuple_v = detail::is_tuple<std::decay_t<T>>::value;

} // namespace ripple
