#pragma once
#include <cstddef>
#include <memory>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/composite_subscription.hpp>
#include <ripple/ops/map.hpp>

namespace ripple {

// flatten(): subscribes to every inner observable as it arrives and merges their values.
// Completes once the outer stream and every inner stream have completed.
struct op_flatten {
  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = typename T::value_type;
    return observable<U>::create([src](observer<U> o){
      auto remaining = std::make_shared<std::size_t>(1);  // the outer stream
      auto comp = std::make_shared<composite_subscription>();

      auto on_err = [o, comp](std::exception_ptr e){
        o.on_error(e);
        comp->unsubscribe();
      };
      auto on_done = [o, remaining]{
        if (--*remaining == 0) o.on_completed();
      };

      comp->add(src.subscribe_for(o,
        [o, comp, remaining, on_err, on_done](const T& inner){
          ++*remaining;
          comp->add(inner.subscribe_for(o,
            [o](const U& v){ o.on_next(v); },
            on_err,
            on_done
          ));
        },
        on_err,
        on_done
      ));
      return subscription([comp]{ comp->unsubscribe(); });
    });
  }
};
inline auto flatten(){ return op_flatten{}; }

// flat_map(f): map(f) then flatten().
template <class F>
inline auto flat_map(F f) {
  return [m = map(std::move(f))](const auto& src){ return op_flatten{}(m(src)); };
}

} // namespace ripple
