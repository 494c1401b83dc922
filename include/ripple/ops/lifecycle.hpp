#pragma once
#include <memory>
#include <tuple>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>

namespace ripple {

// default_if_empty(args...): if the source completes without a value, emits T(args...) first.
template <class... Args>
struct op_default_if_empty {
  std::tuple<Args...> args;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, fallback = std::make_from_tuple<T>(args)](observer<T> o){
      auto seen = std::make_shared<bool>(false);
      return src.subscribe_for(o,
        [o, seen](const T& v){
          *seen = true;
          o.on_next(v);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o, seen, fallback]{
          if (!*seen) o.on_next(fallback);
          o.on_completed();
        }
      );
    });
  }
};
template <class... Args>
inline auto default_if_empty(Args... args){ return op_default_if_empty<Args...>{ std::tuple<Args...>(std::move(args)...) }; }

// ignore_elements(): only the terminal event.
struct op_ignore_elements {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src](observer<T> o){
      return src.subscribe_for(o,
        [](const T&){},
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
inline auto ignore_elements(){ return op_ignore_elements{}; }

} // namespace ripple
