#pragma once
#include <tuple>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>

namespace ripple {

// start_with(v...): emits the given values, then mirrors the source.
template <class... Vs>
struct op_start_with {
  std::tuple<Vs...> seeds;
  template <class T>
  auto operator()(const observable<T>& src) const {
    std::vector<T> head;
    std::apply([&head](const auto&... v){ (head.push_back(static_cast<T>(v)), ...); }, seeds);
    return observable<T>::create([src, head = std::move(head)](observer<T> o){
      for (const auto& v : head) {
        if (o.is_stopped()) return subscription{};
        o.on_next(v);
      }
      return src.subscribe(o);
    });
  }
};
template <class... Vs>
inline auto start_with(Vs... vs){ return op_start_with<Vs...>{ std::tuple<Vs...>(std::move(vs)...) }; }

} // namespace ripple
