#pragma once
#include <cstddef>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>

namespace ripple {

// Traversal strategies: call visit(element) for each element, stop when visit returns false.
struct forward_order {
  template <class C, class Visit>
  void operator()(const C& c, Visit&& visit) const {
    for (auto it = std::begin(c); it != std::end(c); ++it) {
      if (!visit(*it)) return;
    }
  }
};

struct reverse_order {
  template <class C, class Visit>
  void operator()(const C& c, Visit&& visit) const {
    for (auto it = std::rbegin(c); it != std::rend(c); ++it) {
      if (!visit(*it)) return;
    }
  }
};

// Tag: emit (key, value) pairs instead of values.
struct with_keys_t {};
inline constexpr with_keys_t with_keys{};

namespace detail {
template <class C, class = void>
struct is_associative : std::false_type {};
template <class C>
struct is_associative<C, std::void_t<typename C::key_type, typename C::mapped_type>> : std::true_type {};
} // namespace detail

// from_iterable(c[, strategy]): emits the elements of a copy of `c`, then completes.
template <class C, class Strategy = forward_order>
inline auto from_iterable(C c, Strategy strategy = {}) {
  using T = std::decay_t<decltype(*std::begin(c))>;
  auto data = std::make_shared<const C>(std::move(c));
  return observable<T>::create([data, strategy](observer<T> o){
    strategy(*data, [&o](const auto& v){
      o.on_next(v);
      return !o.is_stopped();
    });
    o.on_completed();
    return subscription{};
  });
}

// from_iterable(c, strategy, with_keys): emits (key, value) pairs. Maps use their keys,
// sequences the element index.
template <class C, class Strategy>
inline auto from_iterable(C c, Strategy strategy, with_keys_t) {
  if constexpr (detail::is_associative<C>::value) {
    using T = std::pair<typename C::key_type, typename C::mapped_type>;
    auto data = std::make_shared<const C>(std::move(c));
    return observable<T>::create([data, strategy](observer<T> o){
      strategy(*data, [&o](const auto& kv){
        o.on_next(T(kv.first, kv.second));
        return !o.is_stopped();
      });
      o.on_completed();
      return subscription{};
    });
  } else {
    using V = std::decay_t<decltype(*std::begin(c))>;
    using T = std::pair<std::size_t, V>;
    // index first, so the traversal strategy also orders the keys
    std::vector<T> indexed;
    std::size_t i = 0;
    for (const auto& v : c) indexed.emplace_back(i++, v);
    auto data = std::make_shared<const std::vector<T>>(std::move(indexed));
    return observable<T>::create([data, strategy](observer<T> o){
      strategy(*data, [&o](const T& kv){
        o.on_next(kv);
        return !o.is_stopped();
      });
      o.on_completed();
      return subscription{};
    });
  }
}

} // namespace ripple
