#pragma once
#include <cstddef>
#include <optional>
#include <ripple/core/observable.hpp>

namespace ripple {

// replicate(v, n): emits `v` n times, then completes. Without `n` it emits until
// the observer stops (take/first/... downstream).
template <class V>
inline observable<V> replicate(V value, std::optional<std::size_t> count = std::nullopt) {
  return observable<V>::create([value = std::move(value), count](observer<V> o){
    if (count) {
      for (std::size_t i = 0; i < *count && !o.is_stopped(); ++i) o.on_next(value);
      o.on_completed();
    } else {
      while (!o.is_stopped()) o.on_next(value);
    }
    return subscription{};
  });
}

template <class V>
inline observable<V> repeat(V value, std::optional<std::size_t> count = std::nullopt) {
  return replicate(std::move(value), count);
}

} // namespace ripple
