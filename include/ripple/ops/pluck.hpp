#pragma once
#include <tuple>
#include <type_traits>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

namespace detail {
template <class V, class K>
decltype(auto) pluck_one(const V& v, const K& key) {
  if constexpr (std::is_member_object_pointer_v<K>) {
    return (v.*key);
  } else {
    return v.at(key);
  }
}

template <class V>
const V& pluck_path(const V& v) { return v; }

template <class V, class K, class... Ks>
decltype(auto) pluck_path(const V& v, const K& key, const Ks&... rest) {
  return pluck_path(pluck_one(v, key), rest...);
}

template <class V, class... Ks>
using pluck_result_t =
  std::decay_t<decltype(pluck_path(std::declval<const V&>(), std::declval<const Ks&>()...))>;
} // namespace detail

// pluck(k1, k2, ...): v.k1.k2... where each key is a data-member pointer or an
// argument for at() (map key, index). A missing key surfaces as on_error.
template <class... Ks>
struct op_pluck {
  std::tuple<Ks...> keys;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = detail::pluck_result_t<T, Ks...>;
    return observable<U>::create([src, keys = keys](observer<U> o){
      return src.subscribe_for(o,
        [keys, o](const T& v){
          auto r = invoke_guarded(o, [&]{
            return U(std::apply([&v](const auto&... k) -> decltype(auto) { return detail::pluck_path(v, k...); }, keys));
          });
          if (r) o.on_next(*r);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};

template <class K, class... Ks>
inline auto pluck(K key, Ks... rest) {
  return op_pluck<K, Ks...>{ std::tuple<K, Ks...>(std::move(key), std::move(rest)...) };
}

} // namespace ripple
