#pragma once
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>

namespace ripple {

template <class Pred>
struct op_filter {
  Pred p;
  bool keep{true};  // false: reject
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, p = p, keep = keep](observer<T> o){
      return src.subscribe_for(o,
        [p, keep, o](const T& v){
          auto hit = invoke_guarded(o, p, v);
          if (hit && static_cast<bool>(*hit) == keep) o.on_next(v);
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
    });
  }
};
template <class Pred> op_filter(Pred)->op_filter<Pred>;
template <class Pred> inline auto filter(Pred p){ return op_filter<Pred>{ std::move(p), true }; }
template <class Pred> inline auto reject(Pred p){ return op_filter<Pred>{ std::move(p), false }; }

// compact(): drops contextually false values (0, empty optional, null pointer...).
inline auto compact(){ return filter(truthy); }

// partition(pred): {values passing pred, values failing it}. Each side subscribes on its own.
template <class Pred>
struct op_partition {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return std::make_pair(filter(p)(src), reject(p)(src));
  }
};
template <class Pred> inline auto partition(Pred p){ return op_partition<Pred>{ std::move(p) }; }

} // namespace ripple
