#pragma once
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// scan(f, seed): emits every intermediate accumulation f(acc, v).
template <class F, class S>
struct op_scan {
  F f;
  S seed;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<S>::create([src, f = f, seed = seed](observer<S> o){
      auto acc = std::make_shared<S>(seed);
      return src.subscribe_for(o,
        [f, o, acc](const T& v){
          auto r = invoke_guarded(o, f, std::as_const(*acc), v);
          if (!r) return;
          *acc = std::move(*r);
          o.on_next(*acc);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};

// Unseeded: the first value becomes the accumulator and is not emitted itself.
template <class F>
struct op_scan_unseeded {
  F f;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, f = f](observer<T> o){
      auto acc = std::make_shared<std::optional<T>>();
      return src.subscribe_for(o,
        [f, o, acc](const T& v){
          if (!*acc) {
            *acc = v;
            return;
          }
          auto r = invoke_guarded(o, f, std::as_const(**acc), v);
          if (!r) return;
          **acc = std::move(*r);
          o.on_next(**acc);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};

template <class F> inline auto scan(F f){ return op_scan_unseeded<F>{ std::move(f) }; }
template <class F, class S> inline auto scan(F f, S seed){ return op_scan<F, S>{ std::move(f), std::move(seed) }; }

} // namespace ripple
