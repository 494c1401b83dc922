#pragma once
#include <array>
#include <cstddef>
#include <deque>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/composite_subscription.hpp>
#include <ripple/core/util.hpp>
#include <ripple/ops/detail/sources.hpp>

namespace ripple {

namespace detail {

template <class F, class... Ts>
auto zip_impl(F f, const observable<Ts>&... srcs) {
  using R = std::decay_t<std::invoke_result_t<const F&, const Ts&...>>;
  return observable<R>::create([sources = std::make_tuple(srcs...), f = std::move(f)](observer<R> o){
    struct state_t {
      std::tuple<std::deque<Ts>...> queues;
      std::array<bool, sizeof...(Ts)> done{};
    };
    auto st = std::make_shared<state_t>();
    auto comp = std::make_shared<composite_subscription>();

    // Emits one tuple when every queue holds a value, then closes the stream if
    // a completed source has nothing left to pair.
    auto try_emit = [st, f, o, comp]{
      const bool ready = std::apply([](const auto&... q){ return (!q.empty() && ...); }, st->queues);
      if (ready) {
        auto heads = std::apply([](auto&... q){
          auto t = std::make_tuple(std::move(q.front())...);
          (q.pop_front(), ...);
          return t;
        }, st->queues);
        auto out = invoke_guarded(o, [&]{ return std::apply(f, std::as_const(heads)); });
        if (!out) {
          comp->unsubscribe();
          return;
        }
        o.on_next(*out);
      }

      bool drained = false;
      [&]<std::size_t... I>(std::index_sequence<I...>) {
        drained = ((st->done[I] && std::get<I>(st->queues).empty()) || ...);
      }(std::index_sequence_for<Ts...>{});
      if (drained) {
        o.on_completed();
        comp->unsubscribe();
      }
    };

    [&]<std::size_t... I>(std::index_sequence<I...>) {
      (comp->add(std::get<I>(sources).subscribe_for(o,
        [st, try_emit](const std::tuple_element_t<I, std::tuple<Ts...>>& v){
          std::get<I>(st->queues).push_back(v);
          try_emit();
        },
        [o, comp](std::exception_ptr e){
          o.on_error(e);
          comp->unsubscribe();
        },
        [st, try_emit]{
          st->done[I] = true;
          try_emit();
        }
      )), ...);
    }(std::index_sequence_for<Ts...>{});

    return subscription([comp]{ comp->unsubscribe(); });
  });
}

} // namespace detail

// zip(a, b, ...[, f]): pairs the i-th values of every source into f(a_i, b_i, ...)
// (a tuple without f). Values are buffered per source until their partners arrive.
// Completes as soon as a completed source's buffer is drained.
template <class... Args>
inline auto zip(Args&&... args) {
  return detail::split_trailing_fn(
    detail::make_tuple_fn{},
    [](auto f, const auto&... srcs){ return detail::zip_impl(std::move(f), srcs...); },
    std::forward<Args>(args)...);
}

} // namespace ripple
