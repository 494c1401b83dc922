#pragma once
#include <type_traits>
#include <vector>
#include <ripple/core/observable.hpp>

namespace ripple {

// of(a, b, c): emits each argument in order, then completes.
template <class V, class... Vs>
inline auto of(V first, Vs... rest) {
  using T = std::common_type_t<V, Vs...>;
  std::vector<T> values{static_cast<T>(std::move(first)), static_cast<T>(std::move(rest))...};
  return observable<T>::create([values = std::move(values)](observer<T> o){
    for (const auto& v : values) {
      if (o.is_stopped()) break;
      o.on_next(v);
    }
    o.on_completed();
    return subscription{};
  });
}

} // namespace ripple
