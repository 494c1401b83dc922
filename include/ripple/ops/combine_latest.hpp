#pragma once
#include <cstddef>
#include <memory>
#include <optional>
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
auto combine_latest_impl(F f, const observable<Ts>&... srcs) {
  using R = std::decay_t<std::invoke_result_t<const F&, const Ts&...>>;
  return observable<R>::create([sources = std::make_tuple(srcs...), f = std::move(f)](observer<R> o){
    struct state_t {
      std::tuple<std::optional<Ts>...> latest;
      std::size_t completed{0};
    };
    auto st = std::make_shared<state_t>();
    auto comp = std::make_shared<composite_subscription>();

    auto try_emit = [st, f, o]{
      const bool ready = std::apply([](const auto&... l){ return (static_cast<bool>(l) && ...); }, st->latest);
      if (!ready) return;
      auto out = invoke_guarded(o, [&]{
        return std::apply([&](const auto&... l){ return f(*l...); }, st->latest);
      });
      if (out) o.on_next(*out);
    };

    [&]<std::size_t... I>(std::index_sequence<I...>) {
      (comp->add(std::get<I>(sources).subscribe_for(o,
        [st, try_emit](const std::tuple_element_t<I, std::tuple<Ts...>>& v){
          std::get<I>(st->latest) = v;
          try_emit();
        },
        [o, comp](std::exception_ptr e){
          o.on_error(e);
          comp->unsubscribe();
        },
        [o, st]{
          if (++st->completed == sizeof...(Ts)) o.on_completed();
        }
      )), ...);
    }(std::index_sequence_for<Ts...>{});

    return subscription([comp]{ comp->unsubscribe(); });
  });
}

} // namespace detail

// combine_latest(a, b, ...[, f]): once every source has emitted, each new value from any
// of them emits f(latest...) (a tuple of the latest values without f).
// Completes when all sources have completed; the first error is forwarded at once.
template <class... Args>
inline auto combine_latest(Args&&... args) {
  return detail::split_trailing_fn(
    detail::make_tuple_fn{},
    [](auto f, const auto&... srcs){ return detail::combine_latest_impl(std::move(f), srcs...); },
    std::forward<Args>(args)...);
}

} // namespace ripple
