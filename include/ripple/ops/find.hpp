#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/util.hpp>
#include <ripple/ops/take.hpp>

namespace ripple {

// find(pred): first value satisfying pred, then completes and stops upstream.
template <class Pred>
struct op_find {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, p = p](observer<T> o){
      auto up_ref = std::make_shared<typename observer<T>::weak_ref>();
      auto up = observer<T>::create_for(o,
        [p, o, up_ref](const T& v){
          auto hit = invoke_guarded(o, p, v);
          if (!hit) {
            up_ref->unsubscribe();
            return;
          }
          if (!*hit) return;
          up_ref->unsubscribe();
          o.on_next(v);
          o.on_completed();
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
      *up_ref = up.weak();
      return src.subscribe(up);
    });
  }
};
template <class Pred> inline auto find(Pred p){ return op_find<Pred>{ std::move(p) }; }
inline auto find(){ return find(truthy); }

inline auto first(){ return take(1); }

// last(): the final value, emitted on completion.
struct op_last {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src](observer<T> o){
      auto last = std::make_shared<std::optional<T>>();
      return src.subscribe_for(o,
        [last](const T& v){ *last = v; },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o, last]{
          if (*last) o.on_next(**last);
          o.on_completed();
        }
      );
    });
  }
};
inline auto last(){ return op_last{}; }

// element_at(i): the value at 0-based position i, then completes and stops upstream.
struct op_element_at {
  std::size_t index;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, index = index](observer<T> o){
      auto seen = std::make_shared<std::size_t>(0);
      auto up_ref = std::make_shared<typename observer<T>::weak_ref>();
      auto up = observer<T>::create_for(o,
        [o, seen, index, up_ref](const T& v){
          if ((*seen)++ != index) return;
          up_ref->unsubscribe();
          o.on_next(v);
          o.on_completed();
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{ o.on_completed(); }
      );
      *up_ref = up.weak();
      return src.subscribe(up);
    });
  }
};
inline auto element_at(std::size_t index){ return op_element_at{index}; }

} // namespace ripple
