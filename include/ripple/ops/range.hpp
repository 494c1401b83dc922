#pragma once
#include <stdexcept>
#include <type_traits>
#include <ripple/core/observable.hpp>

namespace ripple {

namespace detail {
// True when i + step still lies within stop. Integers compare distances in the
// unsigned type, so a bound at the edge of N's range neither overflows nor wraps.
template <class N>
bool range_continues(N i, N stop, N step) {
  if constexpr (std::is_integral_v<N>) {
    using U = std::make_unsigned_t<N>;
    if (step > N{0}) {
      return static_cast<U>(static_cast<U>(stop) - static_cast<U>(i)) >= static_cast<U>(step);
    }
    return static_cast<U>(static_cast<U>(i) - static_cast<U>(stop))
        >= static_cast<U>(U{0} - static_cast<U>(step));
  } else {
    return step > N{0} ? stop - i >= step : i - stop >= -step;
  }
}
} // namespace detail

// from_range(start, stop, step): start, start+step, ... while within [start, stop]
// (descending when step < 0). Both bounds are inclusive.
template <class N, std::enable_if_t<std::is_arithmetic_v<N>, int> = 0>
inline observable<N> from_range(N start, N stop, N step = N{1}) {
  if (step == N{0}) {
    throw std::invalid_argument("ripple::from_range: step must not be zero");
  }
  return observable<N>::create([start, stop, step](observer<N> o){
    const bool past_stop = step > N{0} ? start > stop : start < stop;
    if (!past_stop) {
      for (N i = start; !o.is_stopped(); i += step) {
        o.on_next(i);
        if (!detail::range_continues(i, stop, step)) break;
      }
    }
    o.on_completed();
    return subscription{};
  });
}

// from_range(stop): 1..stop.
template <class N, std::enable_if_t<std::is_arithmetic_v<N>, int> = 0>
inline observable<N> from_range(N stop) {
  return from_range<N>(N{1}, stop, N{1});
}

} // namespace ripple
