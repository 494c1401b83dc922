#pragma once
#include <cstdint>
#include <memory>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/ops/map.hpp>

namespace ripple {

// switch_latest(): for an observable of observables, mirrors the most recent inner one.
// A new inner cancels the previous. Inner completion is not forwarded; the outer
// stream's completion completes the result. Errors from either level are forwarded
// and cancel both levels.
struct op_switch_latest {
  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = typename T::value_type;
    return observable<U>::create([src](observer<U> o){
      struct state_t {
        std::uint64_t generation{0};
        subscription inner;
        subscription outer;
        bool cancelled{false};
      };
      auto st = std::make_shared<state_t>();

      auto outer = src.subscribe_for(o,
        [o, st](const T& inner){
          if (st->cancelled) return;
          const auto mine = ++st->generation;
          st->inner.unsubscribe();
          auto sub = inner.subscribe_for(o,
            [o, st, mine](const U& v){ if (st->generation == mine) o.on_next(v); },
            [o, st](std::exception_ptr e){
              o.on_error(e);
              st->cancelled = true;
              st->outer.unsubscribe();
            },
            []{}
          );
          if (st->generation == mine) st->inner = std::move(sub);
        },
        [o, st](std::exception_ptr e){
          o.on_error(e);
          st->inner.unsubscribe();
        },
        [o]{ o.on_completed(); }
      );
      if (st->cancelled) outer.unsubscribe();
      else st->outer = std::move(outer);

      return subscription([st]{
        st->cancelled = true;
        st->inner.unsubscribe();
        st->outer.unsubscribe();
      });
    });
  }
};
inline auto switch_latest(){ return op_switch_latest{}; }

// flat_map_latest(f): map(f) then switch_latest().
template <class F>
inline auto flat_map_latest(F f) {
  return [m = map(std::move(f))](const auto& src){ return op_switch_latest{}(m(src)); };
}

} // namespace ripple
