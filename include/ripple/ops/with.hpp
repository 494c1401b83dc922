#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <tuple>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/composite_subscription.hpp>

namespace ripple {

// with(others...): each source value v becomes (v, latest_1, ..., latest_n), where the
// latest side values are nullopt until that side has produced one. Side streams never
// gate or terminate the result; their errors and completion are ignored.
template <class... Us>
struct op_with {
  std::tuple<observable<Us>...> others;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using R = std::tuple<T, std::optional<Us>...>;
    return observable<R>::create([src, others = others](observer<R> o){
      auto latest = std::make_shared<std::tuple<std::optional<Us>...>>();
      auto comp = std::make_shared<composite_subscription>();

      [&]<std::size_t... I>(std::index_sequence<I...>) {
        (comp->add(std::get<I>(others).subscribe_for(o,
          [latest](const std::tuple_element_t<I, std::tuple<Us...>>& v){ std::get<I>(*latest) = v; },
          [](std::exception_ptr){},
          []{}
        )), ...);
      }(std::index_sequence_for<Us...>{});

      comp->add(src.subscribe_for(o,
        [o, latest](const T& v){
          o.on_next(std::tuple_cat(std::tuple<T>(v), *latest));
        },
        [o, comp](std::exception_ptr e){
          o.on_error(e);
          comp->unsubscribe();
        },
        [o, comp]{
          o.on_completed();
          comp->unsubscribe();
        }
      ));
      return subscription([comp]{ comp->unsubscribe(); });
    });
  }
};

template <class... Us>
inline auto with(observable<Us>... others) {
  return op_with<Us...>{ std::tuple<observable<Us>...>(std::move(others)...) };
}

} // namespace ripple
