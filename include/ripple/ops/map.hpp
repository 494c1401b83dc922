#pragma once
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

template <class F>
struct op_map {
  F f;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    return observable<U>::create([src, f = f](observer<U> o){
      return src.subscribe_for(o,
        [f, o](const T& v){
          auto r = invoke_guarded(o, f, v);
          if (r) o.on_next(*r);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
template <class F> op_map(F)->op_map<F>;
template <class F> inline auto map(F f){ return op_map<F>{ std::move(f) }; }

} // namespace ripple
