#pragma once
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// reduce(f, seed): folds every value, emits the result once the source completes.
template <class F, class S>
struct op_reduce {
  F f;
  S seed;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<S>::create([src, f = f, seed = seed](observer<S> o){
      auto acc = std::make_shared<S>(seed);
      return src.subscribe_for(o,
        [f, o, acc](const T& v){
          auto r = invoke_guarded(o, f, std::as_const(*acc), v);
          if (r) *acc = std::move(*r);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o, acc]{
          o.on_next(*acc);
          o.on_completed();
        }
      );
    });
  }
};

// Unseeded: starts from the first value; an empty source completes without a value.
template <class F>
struct op_reduce_unseeded {
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
          if (r) **acc = std::move(*r);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o, acc]{
          if (*acc) o.on_next(**acc);
          o.on_completed();
        }
      );
    });
  }
};

template <class F> inline auto reduce(F f){ return op_reduce_unseeded<F>{ std::move(f) }; }
template <class F, class S> inline auto reduce(F f, S seed){ return op_reduce<F, S>{ std::move(f), std::move(seed) }; }

} // namespace ripple
