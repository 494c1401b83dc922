#pragma once
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

namespace detail {
template <class F>
struct is_nullable_factory : std::is_pointer<F> {};
template <class R>
struct is_nullable_factory<std::function<R()>> : std::true_type {};
} // namespace detail

// defer(factory): builds a fresh observable for every subscriber.
// A throwing factory is reported through on_error.
template <class F>
inline auto defer(F factory) {
  using O = std::decay_t<std::invoke_result_t<F&>>;
  using T = typename O::value_type;
  if constexpr (detail::is_nullable_factory<F>::value) {
    if (!static_cast<bool>(factory)) {
      throw std::invalid_argument("ripple::defer: empty factory");
    }
  }
  return observable<T>::create([factory = std::move(factory)](observer<T> o){
    auto src = invoke_guarded(o, factory);
    if (!src) return subscription{};
    return src->subscribe(o);
  });
}

} // namespace ripple
