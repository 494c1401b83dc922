#pragma once
#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

// distinct(): each value at most once per subscription.
// Hashable values go through an unordered_set, anything else through a linear scan.
struct op_distinct {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src](observer<T> o){
      if constexpr (std::is_default_constructible_v<std::hash<T>>) {
        auto seen = std::make_shared<std::unordered_set<T>>();
        return src.subscribe_for(o,
          [seen, o](const T& v){ if (seen->insert(v).second) o.on_next(v); },
          [o](std::exception_ptr e){ o.on_error(e); },
          [o]{ o.on_completed(); }
        );
      } else {
        auto seen = std::make_shared<std::vector<T>>();
        return src.subscribe_for(o,
          [seen, o](const T& v){
            if (std::find(seen->begin(), seen->end(), v) != seen->end()) return;
            seen->push_back(v);
            o.on_next(v);
          },
          [o](std::exception_ptr e){ o.on_error(e); },
          [o]{ o.on_completed(); }
        );
      }
    });
  }
};
inline auto distinct(){ return op_distinct{}; }

// distinct_until_changed(cmp): drops values cmp-equal to the previous emitted one.
template <class Cmp>
struct op_distinct_until_changed {
  Cmp cmp;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, cmp = cmp](observer<T> o){
      auto last = std::make_shared<std::optional<T>>();
      return src.subscribe_for(o,
        [cmp, o, last](const T& v){
          if (*last) {
            auto same = invoke_guarded(o, cmp, v, **last);
            if (!same || *same) return;
          }
          *last = v;
          o.on_next(v);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
template <class Cmp = eq_fn>
inline auto distinct_until_changed(Cmp cmp = {}){ return op_distinct_until_changed<Cmp>{ std::move(cmp) }; }

} // namespace ripple
