#pragma once
#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <ripple/core/observable.hpp>
#include <ripple/core/pipeline.hpp>
#include <ripple/core/util.hpp>
#include <ripple/ops/reduce.hpp>

namespace ripple {

// count(pred): number of values satisfying pred, emitted on completion (0 when empty).
template <class Pred>
struct op_count {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<std::size_t>::create([src, p = p](observer<std::size_t> o){
      auto n = std::make_shared<std::size_t>(0);
      return src.subscribe_for(o,
        [p, o, n](const T& v){
          auto hit = invoke_guarded(o, p, v);
          if (hit && *hit) ++*n;
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o, n]{
          o.on_next(*n);
          o.on_completed();
        }
      );
    });
  }
};
template <class Pred> inline auto count(Pred p){ return op_count<Pred>{ std::move(p) }; }
inline auto count(){ return count([](const auto&){ return true; }); }

// sum(): value-initialised seed, so an empty source yields 0.
struct op_sum {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return src | reduce([](const T& a, const T& b){ return static_cast<T>(a + b); }, T{});
  }
};
inline auto sum(){ return op_sum{}; }

// average(): mean as double, nothing emitted for an empty source.
struct op_average {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<double>::create([src](observer<double> o){
      struct acc { double sum{0}; std::size_t n{0}; };
      auto st = std::make_shared<acc>();
      return src.subscribe_for(o,
        [st](const T& v){
          st->sum += static_cast<double>(v);
          ++st->n;
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o, st]{
          if (st->n > 0) o.on_next(st->sum / static_cast<double>(st->n));
          o.on_completed();
        }
      );
    });
  }
};
inline auto average(){ return op_average{}; }

struct op_min {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return src | reduce([](const T& a, const T& b){ return std::min(a, b); });
  }
};
inline auto min(){ return op_min{}; }

struct op_max {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return src | reduce([](const T& a, const T& b){ return std::max(a, b); });
  }
};
inline auto max(){ return op_max{}; }

// all(pred): false as soon as one value fails pred (upstream is stopped), true on completion.
template <class Pred>
struct op_all {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<bool>::create([src, p = p](observer<bool> o){
      auto up_ref = std::make_shared<typename observer<T>::weak_ref>();
      auto up = observer<T>::create_for(o,
        [p, o, up_ref](const T& v){
          auto ok = invoke_guarded(o, p, v);
          if (!ok) {
            up_ref->unsubscribe();
            return;
          }
          if (!*ok) {
            up_ref->unsubscribe();
            o.on_next(false);
            o.on_completed();
          }
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{
          o.on_next(true);
          o.on_completed();
        }
      );
      *up_ref = up.weak();
      return src.subscribe(up);
    });
  }
};
template <class Pred> inline auto all(Pred p){ return op_all<Pred>{ std::move(p) }; }
inline auto all(){ return all(truthy); }

// contains(v): true at the first equal value (upstream is stopped), false on completion.
template <class V>
struct op_contains {
  V value;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<bool>::create([src, value = value](observer<bool> o){
      auto up_ref = std::make_shared<typename observer<T>::weak_ref>();
      auto up = observer<T>::create_for(o,
        [value, o, up_ref](const T& v){
          if (!(v == value)) return;
          up_ref->unsubscribe();
          o.on_next(true);
          o.on_completed();
        },
        [o](std::exception_ptr e){ o.on_error(e); },
        [o]{
          o.on_next(false);
          o.on_completed();
        }
      );
      *up_ref = up.weak();
      return src.subscribe(up);
    });
  }
};
template <class V> inline auto contains(V v){ return op_contains<V>{ std::move(v) }; }

} // namespace ripple
