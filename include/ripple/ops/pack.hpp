#pragma once
#include <iterator>
#include <tuple>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// pack(): T -> std::tuple<T>; tuple events pass through untouched.
struct op_pack {
  template <class T>
  auto operator()(const observable<T>& src) const {
    if constexpr (is_tuple_v<T>) {
      return src;
    } else {
      using U = std::tuple<T>;
      return observable<U>::create([src](observer<U> o){
        return src.subscribe_for(o,
          [o](const T& v){ o.on_next(U(v)); },
          [o](std::exception_ptr e){ o.on_error(e); },
          [o]{ o.on_completed(); }
        );
      });
    }
  }
};
inline op_pack pack(){ return {}; }

// unpack(): std::tuple<T> -> T.
struct op_unpack {
  template <class T>
  auto operator()(const observable<T>& src) const {
    static_assert(is_tuple_v<T> && std::tuple_size_v<T> == 1,
                  "ripple::unpack expects single-element tuple events");
    using U = std::tuple_element_t<0, T>;
    return observable<U>::create([src](observer<U> o){
      return src.subscribe_for(o,
        [o](const T& v){ o.on_next(std::get<0>(v)); },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
inline op_unpack unpack(){ return {}; }

namespace detail {
template <class T, class = void>
struct unwrapped;
template <class... Ts>
struct unwrapped<std::tuple<Ts...>> { using type = std::common_type_t<Ts...>; };
template <class R>
struct unwrapped<R, std::void_t<decltype(std::begin(std::declval<const R&>()))>> {
  using type = std::decay_t<decltype(*std::begin(std::declval<const R&>()))>;
};
} // namespace detail

// unwrap(): each element of a tuple or range event becomes its own event.
struct op_unwrap {
  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = typename detail::unwrapped<T>::type;
    return observable<U>::create([src](observer<U> o){
      return src.subscribe_for(o,
        [o](const T& v){
          if constexpr (is_tuple_v<T>) {
            std::apply([&o](const auto&... e){ (o.on_next(static_cast<U>(e)), ...); }, v);
          } else {
            for (const auto& e : v) o.on_next(e);
          }
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
inline op_unwrap unwrap(){ return {}; }

} // namespace ripple
